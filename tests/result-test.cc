#include <bounded-core/list_error.hh>
#include <bounded-core/result.hh>

#include <nexus/test.hh>

static_assert(std::is_trivially_copyable_v<bc::result<void, bc::list_error>>);
static_assert(std::is_same_v<decltype(bc::error(bc::list_error::list_full)), bc::as_error_t<bc::list_error>>);

namespace
{
bc::result<void, bc::list_error> reserve(int& used, int capacity)
{
    if (used == capacity)
        return bc::error(bc::list_error::list_full);
    ++used;
    return {};
}
} // namespace

TEST("result - default is success")
{
    auto const res = bc::result<void, bc::list_error>{};
    CHECK(res.has_value());
    CHECK(!res.has_error());
}

TEST("result - error")
{
    auto const res = bc::result<void, bc::list_error>{bc::error(bc::list_error::list_full)};
    CHECK(res.has_error());
    CHECK(!res.has_value());
    CHECK(res.error() == bc::list_error::list_full);
}

TEST("result - returned from a function")
{
    int used = 0;
    CHECK(reserve(used, 2).has_value());
    CHECK(reserve(used, 2).has_value());

    auto const res = reserve(used, 2);
    REQUIRE(res.has_error());
    CHECK(res.error() == bc::list_error::list_full);
    CHECK(used == 2);
}
