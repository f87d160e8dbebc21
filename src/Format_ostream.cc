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

#include "Format_ostream.h"

#include <algorithm>
#include <limits>

using namespace rtfmt;

namespace {

// Writes directly into the stream buffer of a std::ostream. Sets the badbit
// on the stream if the buffer does not accept all characters.
class StreamWriter : public Writer
{
    std::ostream& os_;

public:
    explicit StreamWriter(std::ostream& os) : os_(os) {}

private:
    ErrorCode Fail();

    ErrorCode Write(char const* str, size_t len) override;
    ErrorCode Pad(char c, size_t count) override;
};

ErrorCode StreamWriter::Fail()
{
    os_.setstate(std::ios_base::badbit);
    return ErrorCode::io_error;
}

ErrorCode StreamWriter::Write(char const* str, size_t len)
{
    size_t const kMaxChunk = static_cast<size_t>(std::numeric_limits<std::streamsize>::max());

    while (len > 0)
    {
        auto const n = std::min(len, kMaxChunk);
        if (os_.rdbuf()->sputn(str, static_cast<std::streamsize>(n)) != static_cast<std::streamsize>(n))
            return Fail();
        str += n;
        len -= n;
    }

    return ErrorCode::success;
}

ErrorCode StreamWriter::Pad(char c, size_t count)
{
    using traits_type = std::ostream::traits_type;

    for ( ; count > 0; --count)
    {
        if (traits_type::eq_int_type(os_.rdbuf()->sputc(c), traits_type::eof()))
            return Fail();
    }

    return ErrorCode::success;
}

} // namespace

ErrorCode rtfmt::impl::DoFormat(std::ostream& os, StringView format, ArgList const& args)
{
    std::ostream::sentry const ok(os);
    if (!ok)
        return ErrorCode::io_error;

    StreamWriter w{os};
    return ::rtfmt::impl::DoFormat(w, format, args);
}

std::ostream& rtfmt::operator<<(std::ostream& os, Arguments const& args)
{
    if (::rtfmt::impl::DoFormat(os, args.format(), args.args()) == ErrorCode::conversion_error)
        os.setstate(std::ios_base::failbit);

    return os;
}
