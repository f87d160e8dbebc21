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

#ifndef RTFMT_FORMAT_OSTREAM_H
#define RTFMT_FORMAT_OSTREAM_H 1

#include "Format.h"
#include "Format_string.h"

#include <ostream>
#include <utility>

namespace rtfmt {

namespace impl {

// A stream buffer which passes everything on to a Writer and keeps the first
// error the Writer reported.
class WriterStreamBuf final : public std::streambuf
{
    Writer&   w_;
    ErrorCode ec_ = ErrorCode::success;

public:
    explicit WriterStreamBuf(Writer& w) : w_(w) {}

    ErrorCode error() const { return ec_; }

protected:
    int_type overflow(int_type ch) override
    {
        if (traits_type::eq_int_type(ch, traits_type::eof()))
            return traits_type::not_eof(ch);

        if (Failed ec = w_.put(traits_type::to_char_type(ch)))
        {
            if (ec_ == ErrorCode::success)
                ec_ = ec;
            return traits_type::eof();
        }

        return ch;
    }

    std::streamsize xsputn(char const* str, std::streamsize len) override
    {
        if (len <= 0)
            return 0;

        if (Failed ec = w_.write(str, static_cast<size_t>(len)))
        {
            if (ec_ == ErrorCode::success)
                ec_ = ec;
            return 0;
        }

        return len;
    }
};

template <typename T, typename = void>
struct IsStreamable : std::false_type {};

template <typename T>
struct IsStreamable<T, decltype(void(std::declval<std::ostream&>() << std::declval<T const&>()))>
    : std::true_type
{
};

// Inserts the value into a std::ostream writing to w.
// A Writer failure is passed through, any other stream failure is a
// conversion_error.
template <typename T>
ErrorCode InsertValue(Writer& w, T const& val)
{
    WriterStreamBuf buf{w};
    std::ostream os{&buf};
    os << val;

    if (Failed ec = buf.error())
        return ec;
    if (!os)
        return ErrorCode::conversion_error;

    return ErrorCode::success;
}

// Fallback for types with an operator<<. The precision is ignored and the
// width pads the inserted text, since stream flags are not reliably honored
// by user-defined inserters.
template <typename T>
struct StreamValue<T, typename std::enable_if< IsStreamable<T>::value >::type>
{
    ErrorCode operator()(Writer& w, FormatSpec const& spec, T const& val) const
    {
        if (spec.width == 0)
            return InsertValue(w, val);

        std::string str;
        StringWriter sw{str};
        if (Failed ec = InsertValue(sw, val))
            return ec;

        FormatSpec text_spec = spec;
        text_spec.prec = -1;
        return Util::format_string(w, text_spec, str.data(), str.size());
    }
};

RTFMT_API ErrorCode DoFormat(std::ostream& os, StringView format, ArgList const& args);

} // namespace rtfmt::impl

inline ErrorCode format(std::ostream& os, StringView format, ArgList const& args)
{
    return ::rtfmt::impl::DoFormat(os, format, args);
}

template <typename ...Args>
inline ErrorCode format(std::ostream& os, StringView format, Args const&... args)
{
    impl::ArgArray<sizeof...(Args)> arr = {args...};
    return ::rtfmt::impl::DoFormat(os, format, ArgList(arr, sizeof...(Args)));
}

// Renders the bound template into the stream.
// Sets the badbit if the stream fails and the failbit if an argument could
// not be converted.
RTFMT_API std::ostream& operator<<(std::ostream& os, Arguments const& args);

} // namespace rtfmt

#endif // RTFMT_FORMAT_OSTREAM_H
