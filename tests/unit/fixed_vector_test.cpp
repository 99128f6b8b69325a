#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <utility>

#include <goof/fixed_vector.hpp>

using goof::FixedVector;

namespace {
// No default constructor, counts live instances.
struct Tracked {
  explicit Tracked(int v, int* live) : value(v), live(live) { ++*live; }
  Tracked(const Tracked& o) : value(o.value), live(o.live) { ++*live; }
  Tracked(Tracked&& o) noexcept : value(o.value), live(o.live) { ++*live; }
  Tracked& operator=(const Tracked&) = default;
  ~Tracked() { --*live; }
  int value;
  int* live;
};
} // namespace

TEST_CASE("FixedVector refuses to grow past its capacity", "[fixed_vector]") {
  FixedVector<int, 2> v;
  REQUIRE(v.try_push_back(1));
  REQUIRE(v.try_push_back(2));
  REQUIRE(v.full());
  REQUIRE_FALSE(v.try_push_back(3));
  REQUIRE(v.size() == 2);
  REQUIRE(v[0] == 1);
  REQUIRE(v.back() == 2);
}

TEST_CASE("FixedVector stores types without a default constructor", "[fixed_vector]") {
  int live = 0;
  {
    FixedVector<Tracked, 3> v;
    REQUIRE(v.try_emplace_back(7, &live));
    REQUIRE(v.try_emplace_back(8, &live));
    REQUIRE(live == 2);

    FixedVector<Tracked, 3> copy = v;
    REQUIRE(live == 4);
    REQUIRE(copy[1].value == 8);

    FixedVector<Tracked, 3> moved = std::move(copy);
    REQUIRE(moved.size() == 2);
    REQUIRE(copy.empty());
    REQUIRE(live == 4);

    v.clear();
    REQUIRE(live == 2);
  }
  REQUIRE(live == 0);
}

TEST_CASE("FixedVector copy assignment replaces contents", "[fixed_vector]") {
  FixedVector<std::string, 3> a;
  FixedVector<std::string, 3> b;
  REQUIRE(a.try_push_back("x"));
  REQUIRE(b.try_push_back("y"));
  REQUIRE(b.try_push_back("z"));
  a = b;
  REQUIRE(a == b);
  REQUIRE(a.size() == 2);
  REQUIRE(a[0] == "y");
}
