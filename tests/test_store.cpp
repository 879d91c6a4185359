#include "relay/store.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

namespace {

// Exercised through the abstract interface, as the authority uses it
using IntStore = relay::Store<std::string, int>;

std::unique_ptr<IntStore> make_store() {
    return std::make_unique<relay::InMemoryStore<std::string, int>>();
}

bool test_get_set_erase() {
    auto store = make_store();
    if (store->get("a") || store->contains("a") || store->size() != 0) {
        return false;
    }
    store->set("a", 1);
    store->set("a", 2);  // replace
    if (store->get("a") != 2 || store->size() != 1 || !store->contains("a")) {
        return false;
    }
    if (!store->erase("a") || store->erase("a")) {
        return false;
    }
    return store->size() == 0;
}

bool test_get_returns_copy() {
    auto store = make_store();
    store->set("a", 1);
    auto value = store->get("a");
    *value = 99;
    return store->get("a") == 1;
}

bool test_for_each_visits_all() {
    auto store = make_store();
    store->set("a", 1);
    store->set("b", 2);
    store->set("c", 3);
    int sum = 0;
    std::size_t visits = 0;
    store->for_each([&](const std::string&, const int& v) {
        sum += v;
        ++visits;
    });
    return sum == 6 && visits == 3;
}

bool test_erase_if() {
    auto store = make_store();
    for (int i = 0; i < 10; ++i) {
        store->set("k" + std::to_string(i), i);
    }
    std::size_t removed = store->erase_if([](const std::string&, const int& v) {
        return v % 2 == 0;
    });
    if (removed != 5 || store->size() != 5) {
        return false;
    }
    return !store->contains("k0") && store->contains("k1");
}

} // namespace

int main() {
    if (!test_get_set_erase()) {
        std::printf("test_get_set_erase failed\n");
        return EXIT_FAILURE;
    }

    if (!test_get_returns_copy()) {
        std::printf("test_get_returns_copy failed\n");
        return EXIT_FAILURE;
    }

    if (!test_for_each_visits_all()) {
        std::printf("test_for_each_visits_all failed\n");
        return EXIT_FAILURE;
    }

    if (!test_erase_if()) {
        std::printf("test_erase_if failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All store tests passed\n");
    return EXIT_SUCCESS;
}
