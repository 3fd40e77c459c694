#include <unique-seq/serialization.hh>

#include <nexus/test.hh>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace
{
template <class T>
std::string save_to_string(T const& value)
{
    std::ostringstream stream;
    {
        boost::archive::text_oarchive archive(stream);
        archive << value;
    }
    return stream.str();
}

template <class T>
void load_from_string(std::string const& text, T& value)
{
    std::istringstream stream(text);
    boost::archive::text_iarchive archive(stream);
    archive >> value;
}

// no default constructor, restored through load_construct_data
struct label
{
    std::string text;

    explicit label(std::string t) : text(std::move(t)) {}
    bool operator==(label const&) const = default;

    template <class Archive>
    void serialize(Archive& ar, unsigned int /* version */)
    {
        ar & text;
    }
};
} // namespace

namespace boost::serialization
{
template <class Archive>
void save_construct_data(Archive& ar, label const* l, unsigned int /* version */)
{
    ar << l->text;
}

template <class Archive>
void load_construct_data(Archive& ar, label* l, unsigned int /* version */)
{
    std::string text;
    ar >> text;
    ::new (l) label(std::move(text));
}
} // namespace boost::serialization

TEST("serialization - unique_sequence writes the same payload as a vector")
{
    auto const seq = uq::unique_sequence<int>::create_deduplicated({5, 3, 5, 9});
    auto const vec = uq::vector<int>{5, 3, 9};

    CHECK(save_to_string(seq) == save_to_string(vec));

    SECTION("same layout as boost's own std::vector for class types")
    {
        auto const strings = uq::unique_sequence<std::string>::create_deduplicated(
            std::vector<std::string>{"one", "two", "one"});
        auto const std_strings = std::vector<std::string>{"one", "two"};

        CHECK(save_to_string(strings) == save_to_string(std_strings));
    }
}

TEST("serialization - unique_sequence round trip")
{
    auto const original = uq::unique_sequence<std::string>::create_deduplicated(
        std::vector<std::string>{"alpha", "beta", "gamma"});

    auto loaded = uq::unique_sequence<std::string>();
    loaded.push_back("stale");
    load_from_string(save_to_string(original), loaded);

    CHECK(loaded == original);
}

TEST("serialization - empty sequence round trip")
{
    auto const original = uq::unique_sequence<int>();

    auto loaded = uq::unique_sequence<int>::create_deduplicated({1, 2});
    load_from_string(save_to_string(original), loaded);

    CHECK(loaded.empty());
}

TEST("serialization - loading duplicates throws and keeps the target")
{
    // a plain vector may hold duplicates, a unique_sequence must refuse them
    auto const payload = save_to_string(uq::vector<int>{1, 2, 1});

    auto target = uq::unique_sequence<int>::create_deduplicated({7});

    bool thrown = false;
    try
    {
        load_from_string(payload, target);
    }
    catch (boost::archive::archive_exception const& e)
    {
        thrown = true;
        CHECK(e.code == boost::archive::archive_exception::other_exception);
    }

    CHECK(thrown);
    REQUIRE(target.size() == 1);
    CHECK(target[0] == 7);
}

TEST("serialization - vector keeps duplicates")
{
    auto const original = uq::vector<int>{1, 2, 1};

    auto loaded = uq::vector<int>();
    load_from_string(save_to_string(original), loaded);

    CHECK(loaded == original);
}

TEST("serialization - strict_unique_sequence round trip")
{
    auto const original = uq::strict_unique_sequence<int>(uq::unique_sequence<int>::create_deduplicated({4, 2, 4, 8}));

    CHECK(save_to_string(original) == save_to_string(original.as_unique_sequence()));

    auto loaded = uq::strict_unique_sequence<int>(uq::unique_sequence<int>());
    load_from_string(save_to_string(original), loaded);

    CHECK(loaded == original);
}

TEST("serialization - element types without default constructor")
{
    auto original = uq::unique_sequence<label>();
    original.push_back(label("x"));
    original.push_back(label("y"));

    auto loaded = uq::unique_sequence<label>();
    load_from_string(save_to_string(original), loaded);

    REQUIRE(loaded.size() == 2);
    CHECK(loaded[0].text == "x");
    CHECK(loaded[1].text == "y");
}
