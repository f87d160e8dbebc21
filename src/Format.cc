// Copyright (c) 2017 Alexander Bolz
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "Format.h"

#include <double-conversion/bignum-dtoa.h>
#include <double-conversion/fast-dtoa.h>
#include <double-conversion/fixed-dtoa.h>
#include <double-conversion/ieee.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iterator> // stdext::checked_array_iterator
#include <limits>

static_assert(std::numeric_limits<double>::is_iec559,
    "IEEE-754 implementation required for formatting floating-point numbers");

using namespace rtfmt;
using namespace rtfmt::impl;

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

// Maximum number of fractional digits generated for floating-point numbers.
// Larger precisions are filled up with zeros.
static constexpr int kMaxFloatPrec = 1074;

// Precision required for denorm_min (= [751 digits] 10^-323)
static_assert(kMaxFloatPrec >= 751 + 323, "invalid configuration");

static constexpr char const* kDecDigits100 =
    "00010203040506070809"
    "10111213141516171819"
    "20212223242526272829"
    "30313233343536373839"
    "40414243444546474849"
    "50515253545556575859"
    "60616263646566676869"
    "70717273747576777879"
    "80818283848586878889"
    "90919293949596979899";

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

#if defined(_MSC_VER) && (_ITERATOR_DEBUG_LEVEL > 0 && _SECURE_SCL_DEPRECATE)
template <typename RanIt>
static stdext::checked_array_iterator<RanIt> MakeArrayIterator(RanIt first, intptr_t n)
{
    return stdext::make_checked_array_iterator(first, n);
}
#else
template <typename RanIt>
static RanIt MakeArrayIterator(RanIt first, intptr_t /*n*/)
{
    return first;
}
#endif

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

rtfmt::Writer::~Writer() noexcept
{
}

ErrorCode rtfmt::Writer::Put(char c)
{
    return Write(&c, 1);
}

ErrorCode rtfmt::FILEWriter::Put(char c) noexcept
{
    if (EOF == std::fputc(c, file_))
        return ErrorCode::io_error;

    size_ += 1;
    return ErrorCode::success;
}

ErrorCode rtfmt::FILEWriter::Write(char const* ptr, size_t len) noexcept
{
    size_t n = std::fwrite(ptr, 1, len, file_);

    // Count the number of characters successfully transmitted.
    size_ += n;
    return n == len ? ErrorCode::success : ErrorCode::io_error;
}

ErrorCode rtfmt::FILEWriter::Pad(char c, size_t count) noexcept
{
    size_t const kBlockSize = 32;

    char block[kBlockSize];
    std::memset(block, static_cast<unsigned char>(c), kBlockSize);

    while (count > 0)
    {
        auto const n = std::min(count, kBlockSize);
        if (Failed ec = FILEWriter::Write(block, n))
            return ec;
        count -= n;
    }

    return ErrorCode::success;
}

ErrorCode rtfmt::ArrayWriter::Put(char c) noexcept
{
    if (size_ >= bufsize_)
        return ErrorCode::io_error;

    buf_[size_] = c;
    size_ += 1;
    return ErrorCode::success;
}

ErrorCode rtfmt::ArrayWriter::Write(char const* ptr, size_t len) noexcept
{
    size_t const n = std::min(len, bufsize_ - size_);
    if (n > 0)
        std::memcpy(buf_ + size_, ptr, n);

    // Keep the prefix which fits.
    size_ += n;
    return n == len ? ErrorCode::success : ErrorCode::io_error;
}

ErrorCode rtfmt::ArrayWriter::Pad(char c, size_t count) noexcept
{
    size_t const n = std::min(count, bufsize_ - size_);
    if (n > 0)
        std::memset(buf_ + size_, static_cast<unsigned char>(c), n);

    size_ += n;
    return n == count ? ErrorCode::success : ErrorCode::io_error;
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

static bool IsUTF8Continuation(char ch)
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

// Returns the number of code points in the UTF-8 encoded string.
// Invalid sequences count one code point per lead byte.
static size_t CountCodePoints(char const* str, size_t len)
{
    size_t count = 0;
    for (size_t i = 0; i < len; ++i)
    {
        if (!IsUTF8Continuation(str[i]))
            ++count;
    }

    return count;
}

// Returns the length in bytes of the first N code points of STR.
static size_t CodePointPrefix(char const* str, size_t len, size_t n)
{
    size_t i = 0;
    for (size_t count = 0; i < len; ++i)
    {
        if (IsUTF8Continuation(str[i]))
            continue;
        if (count == n)
            break;
        ++count;
    }

    return i;
}

static size_t ComputePadding(size_t len, int width)
{
    assert(width >= 0); // internal error

    size_t const w = static_cast<size_t>(width);
    return w > len ? w - len : 0;
}

// Prints out exactly LEN bytes starting at STR, padding on the left up to
// the field width. Width counts code points.
static ErrorCode PrintAndPadString(Writer& w, FormatSpec const& spec, char const* str, size_t len)
{
    auto const pad = ComputePadding(CountCodePoints(str, len), spec.width);

    if (Failed ec = w.pad(spec.fill, pad))
        return ec;
    if (Failed ec = w.write(str, len))
        return ec;

    return ErrorCode::success;
}

static ErrorCode PrintAndPadString(Writer& w, FormatSpec const& spec, StringView str)
{
    return PrintAndPadString(w, spec, str.data(), str.size());
}

ErrorCode rtfmt::Util::format_string(Writer& w, FormatSpec const& spec, char const* str, size_t len)
{
    size_t const n = (spec.prec >= 0)
        ? CodePointPrefix(str, len, static_cast<size_t>(spec.prec))
        : len;

    return PrintAndPadString(w, spec, str, n);
}

ErrorCode rtfmt::Util::format_string(Writer& w, FormatSpec const& spec, char const* str)
{
    if (str == nullptr)
        return Util::format_string(w, spec, "(null)", 6);

    return Util::format_string(w, spec, str, ::strlen(str));
}

// Numbers are ASCII: width counts bytes here.
// With '0' fill, the zeros go between the sign and the digits.
// NTRAILING zeros are appended after the digits.
static ErrorCode PrintAndPadNumber(Writer& w, FormatSpec const& spec, char sign, char const* digits, size_t ndigits, size_t ntrailing = 0)
{
    size_t const len = (sign ? 1u : 0u) + ndigits + ntrailing;

    auto const pad = ComputePadding(len, spec.width);

    if (spec.fill != '0')
    {
        if (Failed ec = w.pad(spec.fill, pad))
            return ec;
    }
    if (Failed ec = (sign == '\0') ? ErrorCode::success : w.put(sign))
        return ec;
    if (spec.fill == '0')
    {
        if (Failed ec = w.pad('0', pad))
            return ec;
    }
    if (Failed ec = w.write(digits, ndigits))
        return ec;
    if (Failed ec = w.pad('0', ntrailing))
        return ec;

    return ErrorCode::success;
}

static char* DecIntToAsciiBackwards(char* last/*[-20]*/, uint64_t n)
{
    while (n >= 100)
    {
        auto const q = n / 100;
        auto const r = n % 100;
        *--last = kDecDigits100[2*r + 1];
        *--last = kDecDigits100[2*r + 0];
        n = q;
    }

    if (n >= 10)
    {
        *--last = kDecDigits100[2*n + 1];
        *--last = kDecDigits100[2*n + 0];
    }
    else
    {
        *--last = kDecDigits100[2*n + 1];
    }

    return last;
}

ErrorCode rtfmt::Util::format_int(Writer& w, FormatSpec const& spec, int64_t sext, uint64_t zext)
{
    uint64_t number = zext;
    char     sign   = '\0';

    if (sext < 0)
    {
        sign = '-';
        number = 0 - static_cast<uint64_t>(sext);
    }

    // Precision does not apply to integers.
    char buf[20];

    char* l = buf + 20;
    char* f = DecIntToAsciiBackwards(l, number);

    return PrintAndPadNumber(w, spec, sign, f, static_cast<size_t>(l - f));
}

ErrorCode rtfmt::Util::format_bool(Writer& w, FormatSpec const& spec, bool val)
{
    return val
        ? Util::format_string(w, spec, "true", 4)
        : Util::format_string(w, spec, "false", 5);
}

ErrorCode rtfmt::Util::format_char(Writer& w, FormatSpec const& spec, char ch)
{
    return Util::format_string(w, spec, &ch, 1u);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

namespace dtoa {

static int CreateFixedRepresentation(char* buf, int bufsize, int num_digits, int decpt, int precision)
{
    auto I = MakeArrayIterator(buf, bufsize);

    if (decpt <= 0)
    {
        // 0.[000]digits[000]

        assert(precision == 0 || precision >= -decpt + num_digits);

        if (precision > 0)
        {
            // digits --> digits0.[000][000]

            int const nextra = 2 + (precision - num_digits);
            // nextra includes the decimal point.
            std::fill_n(I + num_digits, nextra, '0');
            I[num_digits + 1] = '.';

            // digits0.[000][000] --> 0.[000]digits[000]
            std::rotate(I, I + num_digits, I + (num_digits + 2 + -decpt));

            return 2 + precision;
        }
        else
        {
            buf[0] = '0';
            return 1;
        }
    }

    if (decpt >= num_digits)
    {
        // digits[000][.000]

        int const nzeros = decpt - num_digits;
        int const nextra = precision > 0 ? 1 + precision : 0;
        // nextra includes the decimal point -- if any.

        std::fill_n(I + num_digits, nzeros + nextra, '0');
        if (nextra > 0)
        {
            I[decpt] = '.';
        }

        return decpt + nextra;
    }

    // dig.its[000]

    assert(precision >= num_digits - decpt); // >= 1

    // digits --> dig.its
    std::copy_backward(I + decpt, I + num_digits, I + (num_digits + 1));
    I[decpt] = '.';
    // dig.its --> dig.its[000]
    std::fill_n(I + (num_digits + 1), precision - (num_digits - decpt), '0');

    return decpt + 1 + precision;
}

static void GenerateFixedDigits(double v, int requested_digits, char* buf, int bufsize, int* num_digits, int* decpt)
{
    assert(v >= 0);
    assert(requested_digits >= 0);

    if (v == 0)
    {
        buf[0] = '0';
        *num_digits = 1;
        *decpt = 1;
        return;
    }

    double_conversion::Vector<char> vec(buf, bufsize);

    bool const fast_worked = double_conversion::FastFixedDtoa(v, requested_digits, vec, num_digits, decpt);
    if (!fast_worked)
    {
        double_conversion::BignumDtoa(v, double_conversion::BIGNUM_DTOA_FIXED, requested_digits, vec, num_digits, decpt);
    }
}

// Formats V with exactly PRECISION fractional digits.
static int ToFixed(char* buf, int bufsize, double v, int precision)
{
    int num_digits = 0;
    int decpt = 0;

    GenerateFixedDigits(v, precision, buf, bufsize, &num_digits, &decpt);

    assert(num_digits >= 0);

    // The number was rounded to zero.
    if (num_digits == 0)
        decpt = -precision;

    return CreateFixedRepresentation(buf, bufsize, num_digits, decpt, precision);
}

static void GenerateShortestDigits(double v, char* buf, int bufsize, int* num_digits, int* decpt)
{
    assert(bufsize >= 17 + 1 /*null*/);
    assert(v >= 0);

    if (v == 0)
    {
        buf[0] = '0';
        *num_digits = 1;
        *decpt = 1;
        return;
    }

    double_conversion::Vector<char> vec(buf, bufsize);

    bool const fast_worked = double_conversion::FastDtoa(v, double_conversion::FAST_DTOA_SHORTEST, -1, vec, num_digits, decpt);
    if (!fast_worked)
    {
        double_conversion::BignumDtoa(v, double_conversion::BIGNUM_DTOA_SHORTEST, -1, vec, num_digits, decpt);
    }
}

// Formats V using the shortest representation which round-trips.
// Always uses decimal notation.
static int ToShortestDecimal(char* buf, int bufsize, double v)
{
    auto I = MakeArrayIterator(buf, bufsize);

    int num_digits = 0;
    int decpt = 0;

    GenerateShortestDigits(v, buf, bufsize, &num_digits, &decpt);

    assert(num_digits > 0);

    int const k = num_digits;
    int const n = decpt;

    if (k <= n)
    {
        // digits[000]

        assert(n <= 309);
        std::fill_n(I + k, n - k, '0');
        return n;
    }

    if (0 < n)
    {
        // dig.its

        std::copy_backward(I + n, I + k, I + (k + 1));
        I[n] = '.';
        return k + 1;
    }

    // 0.[000]digits

    assert(-n <= 324);
    std::copy_backward(I, I + k, I + (2 + -n + k));
    I[0] = '0';
    I[1] = '.';
    std::fill_n(I + 2, -n, '0');
    return 2 + (-n) + k;
}

} // namespace dtoa

static ErrorCode HandleSpecialFloat(double_conversion::Double d, Writer& w, FormatSpec const& spec)
{
    assert(d.IsSpecial());

    // Never zero-padded.
    FormatSpec text_spec = spec;
    text_spec.fill = ' ';

    if (d.IsNan())
        return PrintAndPadString(w, text_spec, "NaN");

    return PrintAndPadString(w, text_spec, d.Sign() < 0 ? "-inf" : "inf");
}

ErrorCode rtfmt::Util::format_double(Writer& w, FormatSpec const& spec, double x)
{
    double_conversion::Double const d { x };

    if (d.IsSpecial())
        return HandleSpecialFloat(d, w, spec);

    bool   const neg   = (d.Sign() < 0);
    double const abs_x = std::fabs(x);
    char   const sign  = neg ? '-' : '\0';

    int    prec      = spec.prec;
    size_t ntrailing = 0;
    if (prec > kMaxFloatPrec)
    {
        ntrailing = static_cast<size_t>(prec - kMaxFloatPrec);
        prec = kMaxFloatPrec;
    }

    // Allow printing *ALL* double-precision floating-point values with prec <= kMaxFloatPrec.
    //
    // Mode         Max length
    // ---------------------------------------------
    // Shortest     0.[323 zeros][17 digits]
    // Fixed        [309 digits].[prec digits]
    //
    constexpr int kMaxDigitsBeforePoint = 309;
    constexpr int kBufSize = kMaxDigitsBeforePoint + 1 + kMaxFloatPrec + 1/*null*/;

    char buf[kBufSize];

    int const buflen = (prec >= 0)
        ? dtoa::ToFixed(buf, kBufSize, abs_x, prec)
        : dtoa::ToShortestDecimal(buf, kBufSize, abs_x);

    assert(buflen >= 0);

    return PrintAndPadNumber(w, spec, sign, buf, static_cast<size_t>(buflen), ntrailing);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

ErrorCode rtfmt::Arg::render(Writer& w, FormatSpec const& spec) const
{
    switch (type_)
    {
    case T_STRING:
        return Util::format_string(w, spec, string_.data, string_.size);
    case T_OTHER:
        return other_.func(w, spec, other_.value);
    case T_PCHAR:
        return Util::format_string(w, spec, pchar_);
    case T_BOOL:
        return Util::format_bool(w, spec, bool_);
    case T_CHAR:
        return Util::format_char(w, spec, char_);
    case T_SLONGLONG:
        return Util::format_int(w, spec, slonglong_);
    case T_ULONGLONG:
        return Util::format_int(w, spec, ulonglong_);
    case T_DOUBLE:
        return Util::format_double(w, spec, double_);
    }

    assert(!"internal error");
    return ErrorCode::success; // unreachable
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

namespace {

enum class State {
    literal,
    spec_position,  // {...
    spec_width,     // {...:...
    spec_precision, // {...:....
};

// A sub-range of the template.
struct Field
{
    char const* first = nullptr;
    char const* last  = nullptr;

    Field() = default;
    explicit Field(char const* p) : first(p), last(p) {}

    bool empty() const { return first == last; }
};

// The raw text of a placeholder, split at ':' and '.'.
struct SpecText
{
    Field position;
    Field width;
    Field precision;
};

} // namespace

static bool IsDigit(char ch) { return '0' <= ch && ch <= '9'; }

// Returns the length of the UTF-8 encoded Unicode white space character at
// the start of [f, l), or 0 if there is none.
static size_t SpaceLength(char const* f, char const* l)
{
    auto const n = l - f;
    if (n < 1)
        return 0;

    auto const b0 = static_cast<unsigned char>(f[0]);
    if (b0 == ' ' || (b0 >= '\t' && b0 <= '\r'))
        return 1;

    if (n < 2)
        return 0;

    auto const b1 = static_cast<unsigned char>(f[1]);
    if (b0 == 0xC2)
        return (b1 == 0x85 || b1 == 0xA0) ? 2 : 0; // NEL, NO-BREAK SPACE

    if (n < 3)
        return 0;

    auto const b2 = static_cast<unsigned char>(f[2]);
    switch (b0)
    {
    case 0xE1: // U+1680
        return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
    case 0xE2: // U+2000-200A, U+2028, U+2029, U+202F, U+205F
        if (b1 == 0x80)
            return ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF) ? 3 : 0;
        return (b1 == 0x81 && b2 == 0x9F) ? 3 : 0;
    case 0xE3: // U+3000
        return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
    default:
        return 0;
    }
}

static void TrimSpace(char const*& f, char const*& l)
{
    while (size_t const k = SpaceLength(f, l))
        f += k;

    for (;;)
    {
        size_t k = 0;
        for (size_t n = 1; n <= 3 && n <= static_cast<size_t>(l - f); ++n)
        {
            if (SpaceLength(l - n, l) == n)
            {
                k = n;
                break;
            }
        }

        if (k == 0)
            break;

        l -= k;
    }
}

// Parses a non-negative decimal integer: an optional '+' followed by one or
// more digits. The whole range must be consumed and the value must fit into
// an int.
static bool ParseInt(int& value, char const* f, char const* end)
{
    if (f != end && *f == '+')
        ++f;

    if (f == end)
        return false;

    int x = 0;
    for ( ; f != end; ++f)
    {
        if (!IsDigit(*f))
            return false;

        int const d = *f - '0';
        if (x > (INT_MAX - d) / 10)
            return false;

        x = 10 * x + d;
    }

    value = x;
    return true;
}

// Converts the placeholder text into a FormatSpec and returns the index of
// the argument to render. Unresolvable positions yield SIZE_MAX, which is out
// of range for every argument list.
static size_t ResolvePlaceholder(FormatSpec& spec, SpecText const& text, size_t& nextarg)
{
    auto f = text.position.first;
    auto l = text.position.last;

    TrimSpace(f, l);

    size_t index = SIZE_MAX;
    if (f == l)
    {
        index = nextarg++;
    }
    else
    {
        int i = 0;
        if (ParseInt(i, f, l))
            index = static_cast<size_t>(i);
    }

    int value = 0;

    if (!text.width.empty() && ParseInt(value, text.width.first, text.width.last))
    {
        spec.width = value;
        spec.fill = (*text.width.first == '0') ? '0' : ' ';
    }

    if (!text.precision.empty() && ParseInt(value, text.precision.first, text.precision.last))
    {
        spec.prec = value;
    }

    return index;
}

ErrorCode rtfmt::impl::DoFormat(Writer& w, StringView format, ArgList const& args)
{
    if (format.empty())
        return ErrorCode::success;

    size_t nextarg = 0;

    char const*       f   = format.data();
    char const* const end = f + format.size();
    char const*       s   = f; // Start of the current literal or placeholder
    SpecText          text;
    State             state = State::literal;

    for (;;)
    {
        if (state == State::literal)
        {
            f = std::find_if(f, end, [](char ch) { return ch == '{' || ch == '}'; });
            if (f != s)
            {
                if (Failed ec = w.write(s, static_cast<size_t>(f - s)))
                    return ec;
            }

            if (f == end) // done.
                break;

            if (*f == '}')
            {
                // The next character starts a new literal, whatever it is.
                ++f;
                s = f;
                if (f != end)
                    ++f;
                continue;
            }

            ++f; // skip '{'
            if (f == end) // dangling '{'
                break;

            s = f;
            text.position  = Field(f);
            text.width     = Field();
            text.precision = Field();
            state = State::spec_position;
            continue;
        }

        if (f == end)
        {
            // Unterminated placeholder.
            // The text after the '{' is written as a literal.
            if (Failed ec = w.write(s, static_cast<size_t>(end - s)))
                return ec;
            break;
        }

        char const ch = *f;

        if (ch == '}')
        {
            FormatSpec spec;
            size_t const index = ResolvePlaceholder(spec, text, nextarg);

            if (index < args.size())
            {
                if (Failed ec = args.render(index, w, spec))
                    return ec;
            }

            ++f;
            s = f;
            state = State::literal;
        }
        else if (ch == '{')
        {
            // Abort the placeholder. This '{' starts a new literal.
            s = f;
            ++f;
            state = State::literal;
        }
        else if (ch == ':' && state == State::spec_position)
        {
            ++f;
            text.width = Field(f);
            state = State::spec_width;
        }
        else if (ch == '.' && state == State::spec_width)
        {
            ++f;
            text.precision = Field(f);
            state = State::spec_precision;
        }
        else
        {
            ++f;
            switch (state)
            {
            case State::spec_position:
                text.position.last = f;
                break;
            case State::spec_width:
                text.width.last = f;
                break;
            case State::spec_precision:
                text.precision.last = f;
                break;
            case State::literal:
                assert(!"internal error");
                break;
            }
        }
    }

    return ErrorCode::success;
}

ErrorCode rtfmt::impl::DoFormat(std::FILE* file, StringView format, ArgList const& args)
{
    FILEWriter w{file};
    return rtfmt::impl::DoFormat(w, format, args);
}

ToCharsResult rtfmt::impl::DoFormatToChars(char* first, char* last, StringView format, ArgList const& args)
{
    assert(first <= last);

    ArrayWriter w{first, static_cast<size_t>(last - first)};

    ErrorCode const ec = rtfmt::impl::DoFormat(w, format, args);
    return ToCharsResult(first + w.size(), ec);
}
