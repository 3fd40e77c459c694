#include <unique-seq/assert-handler.hh>
#include <unique-seq/span.hh>
#include <unique-seq/vector.hh>

#include <nexus/test.hh>

#include <type_traits>

static_assert(std::is_trivially_copyable_v<uq::span<int>>);
static_assert(std::is_convertible_v<uq::span<int>, uq::span<int const>>);
static_assert(!std::is_convertible_v<uq::span<int const>, uq::span<int>>);

namespace
{
int sum(uq::span<int const> values)
{
    int s = 0;
    for (auto v : values)
        s += v;
    return s;
}
} // namespace

TEST("span - construction")
{
    int data[] = {4, 5, 6};

    SECTION("default is empty")
    {
        auto const s = uq::span<int>();
        CHECK(s.empty());
        CHECK(s.size() == 0);
        CHECK(s.data() == nullptr);
    }

    SECTION("pointer and size")
    {
        auto const s = uq::span<int>(data, 3);
        CHECK(s.size() == 3);
        CHECK(s.data() == data);
    }

    SECTION("pointer range")
    {
        auto const s = uq::span<int>(data + 1, data + 3);
        CHECK(s.size() == 2);
        CHECK(s.front() == 5);
        CHECK(s.back() == 6);
    }

    SECTION("from container")
    {
        auto v = uq::vector<int>{1, 2, 3, 4};
        auto const s = uq::span<int>(v);
        CHECK(s.size() == 4);
        CHECK(s.data() == v.data());
    }
}

TEST("span - element access writes through")
{
    int data[] = {1, 2, 3};
    auto const s = uq::span<int>(data, 3);

    s[1] = 20;
    s.front() = 10;
    s.back() = 30;

    CHECK(data[0] == 10);
    CHECK(data[1] == 20);
    CHECK(data[2] == 30);
}

TEST("span - iteration and const conversion")
{
    int data[] = {1, 2, 3, 4};
    auto const s = uq::span<int>(data, 4);

    CHECK(sum(s) == 10);
    CHECK(sum({5, 6}) == 11);

    int visited = 0;
    for (auto it = s.begin(); it != s.end(); ++it)
        ++visited;
    CHECK(visited == 4);
}

TEST("span - out of bounds access asserts")
{
    auto handler = uq::impl::scoped_assertion_handler([](uq::impl::assertion_info const&) { throw 0; });

    int data[] = {1, 2};
    auto const s = uq::span<int>(data, 2);
    auto const empty = uq::span<int>();

    int asserts = 0;
    try
    {
        s[2] = 0;
    }
    catch (int)
    {
        ++asserts;
    }
    try
    {
        empty.front() = 0;
    }
    catch (int)
    {
        ++asserts;
    }

    CHECK(asserts == 2);
}
