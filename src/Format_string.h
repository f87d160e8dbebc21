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

#ifndef RTFMT_FORMAT_STRING_H
#define RTFMT_FORMAT_STRING_H 1

#include "Format.h"

#include <string>

namespace rtfmt {

namespace impl {

RTFMT_API ErrorCode DoFormat(std::string& str, StringView format, ArgList const& args);

} // namespace impl

// Appends to a std::string.
class RTFMT_VISIBILITY_DEFAULT StringWriter : public Writer
{
public:
    std::string& str;

    explicit StringWriter(std::string& s) : str(s) {}

private:
    RTFMT_API ErrorCode Put(char c) override;
    RTFMT_API ErrorCode Write(char const* ptr, size_t len) override;
    RTFMT_API ErrorCode Pad(char c, size_t count) override;
};

inline ErrorCode format(std::string& str, StringView format, ArgList const& args)
{
    return ::rtfmt::impl::DoFormat(str, format, args);
}

template <typename ...Args>
inline ErrorCode format(std::string& str, StringView format, Args const&... args)
{
    impl::ArgArray<sizeof...(Args)> arr = {args...};
    return ::rtfmt::impl::DoFormat(str, format, ArgList(arr, sizeof...(Args)));
}

struct StringFormatResult
{
    std::string str;
    ErrorCode ec = ErrorCode{};

    StringFormatResult() = default;
    StringFormatResult(std::string str_, ErrorCode ec_) : str(std::move(str_)), ec(ec_) {}

    // Test for successful conversion
    explicit operator bool() const { return ec == ErrorCode{}; }
};

inline StringFormatResult string_format(StringView format, ArgList const& args)
{
    StringFormatResult r;
    r.ec = ::rtfmt::format(r.str, format, args);
    return r;
}

template <typename ...Args>
inline StringFormatResult string_format(StringView format, Args const&... args)
{
    StringFormatResult r;
    r.ec = ::rtfmt::format(r.str, format, args...);
    return r;
}

} // namespace rtfmt

#endif // RTFMT_FORMAT_STRING_H
