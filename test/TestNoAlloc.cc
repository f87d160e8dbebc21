#include "../src/Format.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdlib>
#include <limits>
#include <new>
#include <string>

//------------------------------------------------------------------------------
// Count the calls to the global allocation functions.
//------------------------------------------------------------------------------

static size_t g_allocations = 0;

void* operator new(size_t size)
{
    ++g_allocations;
    if (void* p = std::malloc(size == 0 ? 1 : size))
        return p;
    throw std::bad_alloc();
}

void* operator new[](size_t size)
{
    ++g_allocations;
    if (void* p = std::malloc(size == 0 ? 1 : size))
        return p;
    throw std::bad_alloc();
}

void operator delete(void* p) noexcept
{
    std::free(p);
}

void operator delete[](void* p) noexcept
{
    std::free(p);
}

void operator delete(void* p, size_t) noexcept
{
    std::free(p);
}

void operator delete[](void* p, size_t) noexcept
{
    std::free(p);
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

struct Point {
    int x;
    int y;
};

namespace rtfmt
{
    template <>
    struct FormatValue<Point> {
        ErrorCode operator()(Writer& w, FormatSpec const& /*spec*/, Point const& value) const {
            return rtfmt::format(w, "({}, {})", value.x, value.y);
        }
    };
}

TEST_CASE("ArrayWriter_does_not_allocate")
{
    char buf[4096];
    rtfmt::ArrayWriter w{buf};

    double const denorm_min = std::numeric_limits<double>::denorm_min();
    double const nan = std::numeric_limits<double>::quiet_NaN();
    Point const pt{3, -4};
    char const* null = nullptr;

    size_t const before = g_allocations;

    rtfmt::ErrorCode const ec1 = rtfmt::format(w, "{} {:08.3} {:.2} {} {} {}|", 42, -3.14159, "hello", true, 'c', null);
    rtfmt::ErrorCode const ec2 = rtfmt::format(w, "{:.1074} {} {:5} {}|", denorm_min, 1e300, nan, pt);
    size_t const mark = w.size();
    rtfmt::ErrorCode const ec3 = rtfmt::format(w, "{{}}x{{}{}}y{ {a} {1:2", 1, 2, 3);

    size_t const after = g_allocations;

    CHECK(before == after);
    CHECK(rtfmt::ErrorCode::success == ec1);
    CHECK(rtfmt::ErrorCode::success == ec2);
    CHECK(rtfmt::ErrorCode::success == ec3);
    CHECK(std::string("42 -003.142 he true c (null)|") == std::string(w.data(), 29));
    CHECK(std::string("{}x{{}y{a 1:2") == std::string(w.data() + mark, w.size() - mark));
}

TEST_CASE("ArgList_does_not_allocate")
{
    int const values[] = {10, 20, 30};
    Point const points[] = {{1, 2}, {3, 4}};
    rtfmt::Arg const mixed[] = {"abc", 1.5, 7u};

    char buf[256];

    size_t const before = g_allocations;

    auto const res1 = rtfmt::format_to_chars(buf, buf + sizeof(buf), "{2}{1}{0}", rtfmt::ArgList(values));
    auto const res2 = rtfmt::format_to_chars(res1.next, buf + sizeof(buf), "{}{}", rtfmt::ArgList(points));
    auto const res3 = rtfmt::format_to_chars(res2.next, buf + sizeof(buf), "{:.1}|{}|{:4}", rtfmt::ArgList(mixed));

    rtfmt::Arguments const nested("<{1}{0}>", rtfmt::ArgList(values));
    auto const res4 = rtfmt::format_to_chars(res3.next, buf + sizeof(buf), "[{}]", nested);

    size_t const after = g_allocations;

    CHECK(before == after);
    CHECK(rtfmt::ErrorCode::success == res4.ec);
    CHECK(std::string("302010(1, 2)(3, 4)a|1.5|   7[<2010>]") == std::string(buf, res4.next));
}

TEST_CASE("Overflow_does_not_allocate")
{
    char buf[8];

    size_t const before = g_allocations;
    auto const res = rtfmt::format_to_chars(buf, buf + sizeof(buf), "{:20}", 1);
    size_t const after = g_allocations;

    CHECK(before == after);
    CHECK(rtfmt::ErrorCode::io_error == res.ec);
    CHECK(buf + sizeof(buf) == res.next);
}
