#include <unique-seq/allocation.hh>
#include <unique-seq/span.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <string>
#include <vector>

namespace
{
// records destruction order through a shared log
struct logged
{
    int value = 0;
    std::vector<int>* log = nullptr;

    logged(int v, std::vector<int>* l) : value(v), log(l) {}
    logged(logged const& rhs) = default;
    ~logged()
    {
        if (log)
            log->push_back(value);
    }
};
} // namespace

TEST("allocation - default is empty and invalid")
{
    auto const a = uq::allocation<int>();
    CHECK(a.alloc_start == nullptr);
    CHECK(a.obj_start == nullptr);
    CHECK(a.obj_end == nullptr);
    CHECK(a.capacity_back() == 0);
}

TEST("allocation - create_empty")
{
    SECTION("with capacity")
    {
        auto const a = uq::allocation<std::string>::create_empty(5);
        CHECK(a.alloc_start != nullptr);
        CHECK(a.obj_start == a.obj_end);
        CHECK(a.capacity_back() == 5);
        CHECK(a.alloc_end - a.alloc_start == 5 * uq::isize(sizeof(std::string)));
        CHECK(a.alignment == uq::isize(alignof(std::string)));
    }

    SECTION("zero capacity does not allocate")
    {
        auto const a = uq::allocation<int>::create_empty(0);
        CHECK(a.alloc_start == nullptr);
        CHECK(a.capacity_back() == 0);
    }

    SECTION("over-aligned")
    {
        auto const a = uq::allocation<int>::create_empty(3, 64);
        CHECK(a.alignment == 64);
        CHECK(reinterpret_cast<std::uintptr_t>(a.alloc_start) % 64 == 0);
    }
}

TEST("allocation - create_copy_of")
{
    auto const source = std::vector<std::string>{"a", "bb", "ccc"};
    auto const a = uq::allocation<std::string>::create_copy_of(uq::span<std::string const>(source.data(), 3));

    REQUIRE(a.obj_end - a.obj_start == 3);
    CHECK(a.obj_start[0] == "a");
    CHECK(a.obj_start[2] == "ccc");
    CHECK(a.capacity_back() == 0);
}

TEST("allocation - move transfers ownership without touching objects")
{
    auto a = uq::allocation<int>::create_copy_of(uq::span<int const>({1, 2, 3}));
    auto const* const start = a.obj_start;

    auto b = uq::move(a);
    CHECK(a.alloc_start == nullptr);
    CHECK(a.obj_start == nullptr);
    CHECK(b.obj_start == start);
    CHECK(b.obj_end - b.obj_start == 3);

    auto c = uq::allocation<int>::create_empty(10);
    c = uq::move(b);
    CHECK(c.obj_start == start);
    CHECK(b.alloc_start == nullptr);
}

TEST("allocation - live objects are destroyed in reverse order")
{
    std::vector<int> log;

    {
        auto a = uq::allocation<logged>::create_empty(3);
        for (auto i = 1; i <= 3; ++i)
        {
            new (uq::placement_new, a.obj_end) logged(i, &log);
            ++a.obj_end;
        }
    }

    REQUIRE(log.size() == 3);
    CHECK(log[0] == 3);
    CHECK(log[1] == 2);
    CHECK(log[2] == 1);
}
