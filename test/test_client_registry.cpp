/**
 * @file test_client_registry.cpp
 * @brief Unit tests for the client registry
 */

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <thread>
#include "../include/pattern/client_registry.hpp"
#include "mocks/mock_tcp_stream.hpp"

using namespace canlink;
using namespace canlink::test;

namespace {
    std::shared_ptr<ClientConnection> make_client(std::uint64_t id) {
        return std::make_shared<ClientConnection>(id, Protocol::COMPACT,
                   std::make_unique<MockTcpStream>(), make_codec(Protocol::COMPACT));
    }
}

TEST_CASE("ClientRegistry - Add and remove", "[registry]") {
    ClientRegistry registry;
    REQUIRE(registry.empty());

    REQUIRE(registry.add(make_client(1)));
    REQUIRE(registry.add(make_client(2)));
    REQUIRE(registry.size() == 2);
    REQUIRE(registry.contains(1));

    SECTION("Duplicate id is refused") {
        REQUIRE_FALSE(registry.add(make_client(1)));
        REQUIRE(registry.size() == 2);
    }

    SECTION("Null client is refused") {
        REQUIRE_FALSE(registry.add(nullptr));
    }

    SECTION("Remove reports presence") {
        REQUIRE(registry.remove(1));
        REQUIRE_FALSE(registry.remove(1));
        REQUIRE_FALSE(registry.contains(1));
        REQUIRE(registry.size() == 1);
    }
}

TEST_CASE("ClientRegistry - Snapshot", "[registry]") {
    ClientRegistry registry;
    registry.add(make_client(3));
    registry.add(make_client(4));
    registry.add(make_client(5));

    auto snapshot = registry.snapshot();
    REQUIRE(snapshot.size() == 3);
    REQUIRE(snapshot[0]->get_id() == 3);
    REQUIRE(snapshot[1]->get_id() == 4);
    REQUIRE(snapshot[2]->get_id() == 5);

    SECTION("Snapshot is unaffected by later removal") {
        registry.remove(4);
        REQUIRE(snapshot.size() == 3);
        REQUIRE(snapshot[1]->get_id() == 4);
        REQUIRE(registry.snapshot().size() == 2);
    }
}

TEST_CASE("ClientRegistry - Concurrent add/remove/snapshot", "[registry][thread]") {
    ClientRegistry registry;
    constexpr std::uint64_t COUNT = 200;

    std::thread adder([&registry]() {
            for (std::uint64_t id = 1; id <= COUNT; ++id) {
                registry.add(make_client(id));
            }
        });
    std::thread remover([&registry]() {
            for (std::uint64_t id = 1; id <= COUNT; id += 2) {
                while (!registry.remove(id)) {
                    std::this_thread::yield();
                }
            }
        });
    std::atomic<int> null_entries{0};
    std::thread reader([&registry, &null_entries]() {
            for (int i = 0; i < 500; ++i) {
                for (const auto& client : registry.snapshot()) {
                    if (!client) {
                        null_entries.fetch_add(1);
                    }
                }
            }
        });

    adder.join();
    remover.join();
    reader.join();

    REQUIRE(null_entries.load() == 0);

    REQUIRE(registry.size() == COUNT / 2);
    for (const auto& client : registry.snapshot()) {
        REQUIRE(client->get_id() % 2 == 0);
    }
}
