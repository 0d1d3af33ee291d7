/**
 * @file result.hpp
 * @brief Result type with automatic error chaining for better error reporting.
 * @version 1.0
 * @date 2026-10-19
 * @copyright Copyright (c) 2026
 */

#pragma once
#include "../enums/error.hpp"
#include <string>
#include <variant>
#include <vector>

namespace canlink {

/**
 * @brief Result type with automatic error chaining.
 *
 * Wraps a value of type T or an error status. When an error is propagated
 * through error(), the operation names are appended so describe() shows the
 * path the failure took.
 *
 * @tparam T The type of the value being returned.
 */
    template<typename T>
    class Result {
        private:
            std::variant<T, Status> value_or_error_;
            std::vector<std::string> error_chain_;

        public:
            // Default constructor with error status
            Result() : value_or_error_(Status::UNKNOWN) {
            }

            bool ok() const {
                return std::holds_alternative<T>(value_or_error_);
            }

            bool fail() const {
                return !ok();
            }

            explicit operator bool() const {
                return ok();
            }

            bool operator!() const {
                return !ok();
            }

            // Value access (throws std::bad_variant_access if error)
            const T& value() const {
                return std::get<T>(value_or_error_);
            }

            T& value() {
                return std::get<T>(value_or_error_);
            }

            Status error() const {
                return fail() ? std::get<Status>(value_or_error_) : Status::SUCCESS;
            }

            std::string describe() const {
                if (ok()) return "Success";

                std::string result = status_message(error());
                if (!error_chain_.empty()) {
                    result += " [";
                    for (size_t i = 0; i < error_chain_.size(); ++i) {
                        if (i > 0) result += " -> ";
                        result += error_chain_[i];
                    }
                    result += "]";
                }
                return result;
            }

            std::string to_string() const {
                return describe();
            }

            const std::vector<std::string>& error_chain() const {
                return error_chain_;
            }

            // Factory methods with context
            static Result success(T val, const std::string& op = "") {
                Result r;
                r.value_or_error_ = std::move(val);
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            static Result error(Status status, const std::string& op = "") {
                Result r;
                r.value_or_error_ = status;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            // Propagate error from another Result
            template<typename U>
            static Result error(const Result<U>& failed_result, const std::string& op = "") {
                Result r;
                r.value_or_error_ = failed_result.error();
                r.error_chain_ = failed_result.error_chain();
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }
    };

/**
 * @brief Specialization for Result<void> - operations that don't return values.
 */
    template<>
    class Result<void> {
        private:
            Status status_ = Status::SUCCESS;
            std::vector<std::string> error_chain_;

        public:
            bool ok() const {
                return status_ == Status::SUCCESS;
            }

            bool fail() const {
                return !ok();
            }

            explicit operator bool() const {
                return ok();
            }

            bool operator!() const {
                return !ok();
            }

            Status error() const {
                return status_;
            }

            std::string describe() const {
                if (ok()) return "Success";

                std::string result = status_message(status_);
                if (!error_chain_.empty()) {
                    result += " [";
                    for (size_t i = 0; i < error_chain_.size(); ++i) {
                        if (i > 0) result += " -> ";
                        result += error_chain_[i];
                    }
                    result += "]";
                }
                return result;
            }

            std::string to_string() const {
                return describe();
            }

            const std::vector<std::string>& error_chain() const {
                return error_chain_;
            }

            static Result success(const std::string& op = "") {
                Result r;
                r.status_ = Status::SUCCESS;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            static Result error(Status status, const std::string& op = "") {
                Result r;
                r.status_ = status;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            template<typename U>
            static Result error(const Result<U>& failed_result, const std::string& op = "") {
                Result r;
                r.status_ = failed_result.error();
                r.error_chain_ = failed_result.error_chain();
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }
    };

} // namespace canlink
