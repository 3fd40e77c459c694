#include <unique-seq/assert-handler.hh>
#include <unique-seq/vector.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <vector>

namespace
{
// counts special member calls
struct counted
{
    int value = 0;

    static inline int copies = 0;
    static inline int moves = 0;
    static inline int live = 0;

    static void reset()
    {
        copies = 0;
        moves = 0;
        live = 0;
    }

    explicit counted(int v) : value(v) { ++live; }
    counted(counted const& rhs) : value(rhs.value)
    {
        ++copies;
        ++live;
    }
    counted(counted&& rhs) noexcept : value(rhs.value)
    {
        ++moves;
        ++live;
    }
    counted& operator=(counted const&) = default;
    counted& operator=(counted&&) noexcept = default;
    ~counted() { --live; }
};

template <class T>
bool equals(uq::vector<T> const& v, std::vector<T> const& expected)
{
    if (v.size() != uq::isize(expected.size()))
        return false;
    for (uq::isize i = 0; i < v.size(); ++i)
        if (!(v[i] == expected[i]))
            return false;
    return true;
}
} // namespace

TEST("vector - default construction")
{
    auto const v = uq::vector<int>();
    CHECK(v.empty());
    CHECK(v.size() == 0);
    CHECK(v.capacity() == 0);
    CHECK(v.data() == nullptr);
    CHECK(v.begin() == v.end());
}

TEST("vector - push_back growth keeps order")
{
    auto v = uq::vector<int>();
    for (auto i = 0; i < 100; ++i)
        v.push_back(i * 3);

    REQUIRE(v.size() == 100);
    CHECK(v.capacity() >= 100);
    CHECK(v.front() == 0);
    CHECK(v.back() == 297);
    for (auto i = 0; i < 100; ++i)
        CHECK(v[i] == i * 3);
}

TEST("vector - push_back of own element during growth")
{
    auto v = uq::vector<std::string>{"first", "second", "third", "fourth"};
    REQUIRE(v.size() == v.capacity());

    v.push_back(v[0]);
    CHECK(equals(v, {"first", "second", "third", "fourth", "first"}));
}

TEST("vector - growth moves instead of copying")
{
    counted::reset();

    {
        auto v = uq::vector<counted>();
        for (auto i = 0; i < 20; ++i)
            v.emplace_back(i);

        CHECK(counted::copies == 0);
        CHECK(counted::live == 20);
    }

    CHECK(counted::live == 0);
}

TEST("vector - pop_back")
{
    auto v = uq::vector<std::string>{"a", "b", "c"};

    auto const last = v.pop_back();
    CHECK(last == "c");
    CHECK(equals(v, {"a", "b"}));

    CHECK(v.pop_back() == "b");
    CHECK(equals(v, {"a"}));
}

TEST("vector - clear keeps capacity")
{
    auto v = uq::vector<int>{1, 2, 3};
    auto const cap = v.capacity();

    v.clear();
    CHECK(v.empty());
    CHECK(v.capacity() == cap);

    v.push_back(4);
    CHECK(equals(v, {4}));
}

TEST("vector - reserve")
{
    auto v = uq::vector<int>{1, 2};
    v.reserve(50);
    CHECK(v.capacity() >= 50);
    CHECK(equals(v, {1, 2}));

    auto const* const data = v.data();
    for (auto i = 3; i <= 50; ++i)
        v.push_back(i);
    CHECK(v.data() == data);

    // never shrinks
    v.reserve(1);
    CHECK(v.capacity() >= 50);
}

TEST("vector - index_of and contains")
{
    auto const v = uq::vector<std::string>{"x", "y", "z"};

    CHECK(v.index_of("x") == 0);
    CHECK(v.index_of("z") == 2);
    CHECK(v.index_of("w") == -1);
    CHECK(v.contains("y"));
    CHECK(!v.contains("w"));
}

TEST("vector - factories")
{
    SECTION("create_with_capacity")
    {
        auto const v = uq::vector<int>::create_with_capacity(8);
        CHECK(v.empty());
        CHECK(v.capacity() == 8);
    }

    SECTION("create_copy_of")
    {
        int const src[] = {5, 6, 7};
        auto const v = uq::vector<int>::create_copy_of(uq::span<int const>(src, 3));
        CHECK(equals(v, {5, 6, 7}));
    }

    SECTION("create_from_allocation adopts the objects")
    {
        auto a = uq::allocation<int>::create_copy_of(uq::span<int const>({1, 2, 3}));
        auto const* const data = a.obj_start;

        auto const w = uq::vector<int>::create_from_allocation(uq::move(a));
        CHECK(a.obj_start == nullptr);
        CHECK(w.data() == data);
        CHECK(equals(w, {1, 2, 3}));
    }
}

TEST("vector - copy and move")
{
    auto a = uq::vector<std::string>{"p", "q"};

    auto b = a;
    CHECK(b == a);
    CHECK(b.data() != a.data());

    b.push_back("r");
    CHECK(!(b == a));

    auto const* const data = b.data();
    auto c = uq::move(b);
    CHECK(c.data() == data);
    CHECK(b.empty());

    a = c;
    CHECK(equals(a, {"p", "q", "r"}));
}

TEST("vector - move-only elements")
{
    auto v = uq::vector<std::unique_ptr<int>>();
    v.push_back(std::make_unique<int>(1));
    v.push_back(std::make_unique<int>(2));
    v.emplace_back(new int(3));

    REQUIRE(v.size() == 3);
    CHECK(*v[2] == 3);

    auto p = v.pop_back();
    CHECK(*p == 3);
    CHECK(v.size() == 2);
}

TEST("vector - precondition violations assert")
{
    auto handler = uq::impl::scoped_assertion_handler([](uq::impl::assertion_info const&) { throw 0; });

    auto v = uq::vector<int>{1, 2, 3};
    auto empty = uq::vector<int>();

    auto asserts = [](auto&& f)
    {
        try
        {
            f();
        }
        catch (int)
        {
            return true;
        }
        return false;
    };

    CHECK(asserts([&] { v[3] = 0; }));
    CHECK(asserts([&] { v[-1] = 0; }));
    CHECK(asserts([&] { empty.front() = 0; }));
    CHECK(asserts([&] { empty.back() = 0; }));
    CHECK(asserts([&] { (void)empty.pop_back(); }));

    // nothing changed
    CHECK(equals(v, {1, 2, 3}));
}
