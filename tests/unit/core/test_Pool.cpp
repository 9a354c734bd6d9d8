#include <widgetspace/core/Pool.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace WS;

TEST_SUITE("core.pool") {
    TEST_CASE("spawn_and_borrow") {
        Pool<std::string> pool;
        auto const a = pool.spawn("alpha");
        auto const b = pool.spawn("beta");

        CHECK(a.is_some());
        CHECK(a != b);
        CHECK(pool.borrow(a) == "alpha");
        CHECK(pool.borrow(b) == "beta");
        CHECK(pool.alive_count() == 2);
        CHECK(pool.capacity() == 2);

        pool.borrow(a) = "gamma";
        CHECK(std::as_const(pool).borrow(a) == "gamma");
    }

    TEST_CASE("free_invalidates_handle_and_reuses_slot") {
        Pool<int> pool;
        auto const first = pool.spawn(1);
        CHECK(pool.free(first) == 1);
        CHECK_FALSE(pool.is_valid_handle(first));
        CHECK(pool.alive_count() == 0);

        auto const second = pool.spawn(2);
        CHECK(second.index() == first.index());
        CHECK(second.generation() != first.generation());
        CHECK(pool.is_valid_handle(second));
        CHECK_FALSE(pool.is_valid_handle(first));
        CHECK_THROWS_AS((void)pool.borrow(first), ContractViolation);
        CHECK(pool.borrow(second) == 2);
    }

    TEST_CASE("borrow_failures_carry_codes") {
        Pool<int> pool;
        auto const live = pool.spawn(5);

        auto code_of = [&](Handle<int> handle) {
            try {
                (void)pool.borrow(handle);
            } catch (ContractViolation const& violation) {
                return violation.code;
            }
            return Error::Code::InvalidError;
        };

        CHECK(code_of(Handle<int>{}) == Error::Code::InvalidHandle);
        CHECK(code_of(Handle<int>{42, 1}) == Error::Code::InvalidHandle);
        CHECK(code_of(Handle<int>{live.index(), live.generation() + 1}) == Error::Code::StaleHandle);

        auto taken = pool.take_at(live.index());
        REQUIRE(taken.has_value());
        CHECK(code_of(live) == Error::Code::SlotVacant);
    }

    TEST_CASE("is_valid_handle_never_throws") {
        Pool<int> pool;
        CHECK_FALSE(pool.is_valid_handle(Handle<int>{}));
        CHECK_FALSE(pool.is_valid_handle(Handle<int>{7, 3}));
        auto const h = pool.spawn(1);
        CHECK(pool.is_valid_handle(h));
    }

    TEST_CASE("take_at_and_put_back_keep_generation") {
        Pool<std::unique_ptr<int>> pool;
        auto const h = pool.spawn(std::make_unique<int>(9));

        auto taken = pool.take_at(h.index());
        REQUIRE(taken.has_value());
        CHECK(**taken == 9);
        CHECK_FALSE(pool.is_valid_handle(h));
        CHECK(pool.alive_count() == 0);

        // A taken slot is not on the free list.
        auto const other = pool.spawn(std::make_unique<int>(1));
        CHECK(other.index() != h.index());

        pool.put_back(h.index(), std::move(*taken));
        CHECK(pool.is_valid_handle(h));
        CHECK(*pool.borrow(h) == 9);
        CHECK(pool.alive_count() == 2);

        CHECK_FALSE(pool.take_at(99).has_value());
    }

    TEST_CASE("current_handle_covers_taken_slots") {
        Pool<std::unique_ptr<int>> pool;
        auto const h = pool.spawn(std::make_unique<int>(4));
        CHECK(pool.is_current_handle(h));

        auto taken = pool.take_at(h.index());
        REQUIRE(taken.has_value());
        CHECK_FALSE(pool.is_valid_handle(h));
        CHECK(pool.is_current_handle(h));

        pool.put_back(h.index(), std::move(*taken));
        (void)pool.free(h);
        CHECK_FALSE(pool.is_current_handle(h));
        CHECK_FALSE(pool.is_current_handle(Handle<std::unique_ptr<int>>{}));
    }

    TEST_CASE("put_back_rejects_occupied_or_out_of_range") {
        Pool<int> pool;
        auto const h = pool.spawn(1);
        CHECK_THROWS_AS(pool.put_back(h.index(), 2), ContractViolation);
        CHECK_THROWS_AS(pool.put_back(10, 2), ContractViolation);
        CHECK(pool.borrow(h) == 1);
    }

    TEST_CASE("for_each_visits_live_entries_in_index_order") {
        Pool<int> pool;
        auto const a = pool.spawn(10);
        auto const b = pool.spawn(20);
        auto const c = pool.spawn(30);
        (void)pool.free(b);

        std::vector<int>        values;
        std::vector<Handle<int>> handles;
        pool.for_each([&](Handle<int> handle, int& value) {
            handles.push_back(handle);
            values.push_back(value);
        });
        CHECK(values == std::vector<int>{10, 30});
        CHECK(handles == std::vector<Handle<int>>{a, c});
        CHECK(pool.handle_from_index(0) == a);
        CHECK(pool.handle_from_index(5).is_none());
    }

    TEST_CASE("clear_drops_everything") {
        Pool<int> pool;
        (void)pool.spawn(1);
        (void)pool.spawn(2);
        pool.clear();
        CHECK(pool.alive_count() == 0);
        CHECK(pool.capacity() == 0);
    }
}
