#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "storage/clipboard_store.hpp"
#include <algorithm>

using namespace cliped;
using namespace cliped::storage;

namespace {

// Small alphabet so generated histories repeat themselves.
rc::Gen<std::string> gen_clip() {
    return rc::gen::map(rc::gen::inRange(0, 12), [](int n) { return "clip " + std::to_string(n); });
}

} // namespace

TEST_CASE("Property: history matches a capped most-recent-first list", "[property][store]") {
    rc::check("page(0, cap) equals the model after any append sequence",
        []() {
            const auto cap = *rc::gen::inRange(1, 8);
            const auto clips = *rc::gen::container<std::vector<std::string>>(gen_clip());

            const auto local = Uuid::generate();
            auto store = ClipboardStore::open("", local, cap).unwrap();

            std::vector<std::string> model;
            for (const auto& clip : clips) {
                auto appended = store->append(create_text_entry(clip, local));
                const bool present = std::find(model.begin(), model.end(), clip) != model.end();
                RC_ASSERT(appended.is_ok() == !present);
                if (present) continue;
                model.insert(model.begin(), clip);
                if (model.size() > static_cast<size_t>(cap)) model.resize(static_cast<size_t>(cap));
            }

            const auto page = store->page(0, cap + 5).unwrap();
            std::vector<std::string> actual;
            for (const auto& entry : page) actual.push_back(entry.content);
            RC_ASSERT(actual == model);
            RC_ASSERT(store->count().unwrap() == static_cast<int>(model.size()));
        }
    );
}

TEST_CASE("Property: pages tile the history without gaps", "[property][store]") {
    rc::check("concatenated pages equal one big page",
        []() {
            const auto total = *rc::gen::inRange(0, 30);
            const auto page_size = *rc::gen::inRange(1, 7);

            const auto local = Uuid::generate();
            auto store = ClipboardStore::open("", local, 100).unwrap();
            for (int i = 0; i < total; ++i) {
                RC_ASSERT(store->append(create_text_entry("entry " + std::to_string(i), local)).is_ok());
            }

            std::vector<std::string> tiled;
            for (int offset = 0;; offset += page_size) {
                auto page = store->page(offset, page_size).unwrap();
                if (page.empty()) break;
                RC_ASSERT(page.size() <= static_cast<size_t>(page_size));
                for (const auto& entry : page) tiled.push_back(entry.id);
            }

            std::vector<std::string> whole;
            for (const auto& entry : store->page(0, total + 1).unwrap()) whole.push_back(entry.id);
            RC_ASSERT(tiled == whole);
            RC_ASSERT(tiled.size() == static_cast<size_t>(total));
        }
    );
}

TEST_CASE("Property: entry ids depend only on type and content", "[property][entry]") {
    rc::check("same text gives the same id on any device",
        [](const std::string& a, const std::string& b) {
            const auto one = create_text_entry(a, Uuid::generate());
            const auto two = create_text_entry(b, Uuid::generate());
            RC_ASSERT((one.id == two.id) == (a == b));
            RC_ASSERT(validate_entry(one).is_ok());
        }
    );
}
