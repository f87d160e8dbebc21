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

#ifndef RTFMT_FORMAT_H
#define RTFMT_FORMAT_H 1

#ifndef RTFMT_HAS_INCLUDE
#  if defined(__has_include)
#    define RTFMT_HAS_INCLUDE(X) __has_include(X)
#  else
#    define RTFMT_HAS_INCLUDE(X) 0
#  endif
#endif

#include <cassert>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#if (__cplusplus >= 201703 && RTFMT_HAS_INCLUDE(<string_view>)) || (_MSC_VER >= 1910 && _HAS_CXX17)
#  define RTFMT_HAS_STD_STRING_VIEW 1
#  include <string_view>
#elif __cplusplus > 201103 && RTFMT_HAS_INCLUDE(<experimental/string_view>)
#  define RTFMT_HAS_STD_EXPERIMENTAL_STRING_VIEW 1
#  include <experimental/string_view>
#endif
#include <type_traits>
#include <utility>

#ifdef _MSC_VER
#  define RTFMT_VISIBILITY_DEFAULT
#else
#  define RTFMT_VISIBILITY_DEFAULT __attribute__((visibility("default")))
#endif

#ifdef RTFMT_SHARED
#  ifdef _MSC_VER
#    ifdef RTFMT_EXPORT
#      define RTFMT_API __declspec(dllexport)
#    else
#      define RTFMT_API __declspec(dllimport)
#    endif
#  else
#    ifdef RTFMT_EXPORT
#      define RTFMT_API RTFMT_VISIBILITY_DEFAULT
#    else
#      define RTFMT_API
#    endif
#  endif
#else
#  define RTFMT_API
#endif

namespace rtfmt {

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

#if RTFMT_HAS_STD_STRING_VIEW
using StringView = std::string_view;
#elif RTFMT_HAS_STD_EXPERIMENTAL_STRING_VIEW
using StringView = std::experimental::string_view;
#else
class StringView // A minimal replacement for std::string_view
{
    char const* data_ = nullptr;
    size_t      size_ = 0;

public:
    using pointer  = char const*;
    using iterator = char const*;

public:
    constexpr StringView() = default;
    constexpr StringView(pointer p, size_t len) : data_(p), size_(len) {}

    StringView(pointer c_str)
        : data_(c_str)
        , size_(c_str ? ::strlen(c_str) : 0u)
    {
    }

    template <
        typename T,
        typename DataT = decltype(std::declval<T const&>().data()),
        typename SizeT = decltype(std::declval<T const&>().size()),
        typename = typename std::enable_if<
            std::is_convertible<DataT, pointer>::value &&
            std::is_convertible<SizeT, size_t>::value
        >::type
    >
    constexpr StringView(T const& str)
        : data_(str.data())
        , size_(str.size())
    {
    }

    // Returns a pointer to the start of the string.
    // NOTE: Not neccessarily null-terminated!
    constexpr pointer data() const { return data_; }

    // Returns the length of the string.
    constexpr size_t size() const { return size_; }

    // Returns whether the string is empty.
    constexpr bool empty() const { return size_ == 0; }

    // Returns an iterator pointing to the start of the string.
    constexpr iterator begin() const { return data_; }

    // Returns an iterator pointing past the end of the string.
    constexpr iterator end() const { return data_ + size_; }
};
#endif

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

enum struct ErrorCode {
    success = 0,
    conversion_error,       // Value could not be converted to string.
    io_error,               // Writer failed. (Buffer full, short write, bad stream.)
};

// Wraps an error code, may be checked for failure.
// Replaces err::operator bool() in most cases (and is more explicit).
struct Failed
{
    ErrorCode const ec = ErrorCode::success;

    Failed() = default;
    Failed(ErrorCode ec_) : ec(ec_) {}
    operator ErrorCode() const { return ec; }
    explicit operator bool() const { return ec != ErrorCode::success; }
};

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

// The resolved directives of a single placeholder.
struct RTFMT_VISIBILITY_DEFAULT FormatSpec
{
    int  width = 0;   // Minimum field width. 0 means no constraint.
    int  prec  = -1;  // Precision. Negative means none.
    char fill  = ' '; // Padding character, ' ' or '0'.
};

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

// The base class for output streams.
class RTFMT_VISIBILITY_DEFAULT Writer
{
public:
    RTFMT_API virtual ~Writer() noexcept;

    // Write a character to the output stream.
    ErrorCode put(char c) { return Put(c); }

    // Insert a range of characters into the output stream.
    ErrorCode write(char const* str, size_t len) { return len == 0 ? ErrorCode::success : Write(str, len); }

    // Insert a character multiple times into the output stream.
    ErrorCode pad(char c, size_t count) { return count == 0 ? ErrorCode::success : Pad(c, count); }

private:
    // Defaults to Write(&c, 1).
    RTFMT_API virtual ErrorCode Put(char c);
    virtual ErrorCode Write(char const* str, size_t len) = 0;
    virtual ErrorCode Pad(char c, size_t count) = 0;
};

// Write to std::FILE's, keeping track of the number of characters (successfully) transmitted.
class RTFMT_VISIBILITY_DEFAULT FILEWriter : public Writer
{
    std::FILE* const file_;
    size_t           size_ = 0;

public:
    explicit FILEWriter(std::FILE* v) : file_(v)
    {
        assert(file_ != nullptr);
    }

    // Returns the number of bytes successfully transmitted (since construction).
    size_t size() const { return size_; }

private:
    RTFMT_API ErrorCode Put(char c) noexcept override;
    RTFMT_API ErrorCode Write(char const* ptr, size_t len) noexcept override;
    RTFMT_API ErrorCode Pad(char c, size_t count) noexcept override;
};

// Write to a user allocated buffer of fixed capacity.
// Once the buffer is full, the characters which still fit are stored and the
// write fails with io_error. The buffer is never null-terminated.
class RTFMT_VISIBILITY_DEFAULT ArrayWriter : public Writer
{
    char*  const buf_     = nullptr;
    size_t const bufsize_ = 0;
    size_t       size_    = 0;

public:
    ArrayWriter(char* buffer, size_t buffer_size) : buf_(buffer), bufsize_(buffer_size)
    {
        assert(bufsize_ == 0 || buf_ != nullptr);
    }

    template <size_t N>
    explicit ArrayWriter(char (&buf)[N]) : ArrayWriter(buf, N) {}

    // Returns a pointer to the string.
    char* data() const { return buf_; }

    // Returns the buffer capacity.
    size_t capacity() const { return bufsize_; }

    // Returns the length of the string.
    size_t size() const { return size_; }

    // Returns true if the buffer is full.
    bool full() const { return size_ == bufsize_; }

    // Returns the string.
    StringView view() const { return StringView(data(), size()); }

private:
    RTFMT_API ErrorCode Put(char c) noexcept override;
    RTFMT_API ErrorCode Write(char const* ptr, size_t len) noexcept override;
    RTFMT_API ErrorCode Pad(char c, size_t count) noexcept override;
};

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

struct Util
{
    // Note:
    // The string must not be null. Width and precision count UTF-8 code points.
    static RTFMT_API ErrorCode format_string(Writer& w, FormatSpec const& spec, char const* str, size_t len);
    // Note:
    // This function handles nullptr's.
    static RTFMT_API ErrorCode format_string(Writer& w, FormatSpec const& spec, char const* str);
    static RTFMT_API ErrorCode format_int   (Writer& w, FormatSpec const& spec, int64_t sext, uint64_t zext);
    static RTFMT_API ErrorCode format_bool  (Writer& w, FormatSpec const& spec, bool val);
    static RTFMT_API ErrorCode format_char  (Writer& w, FormatSpec const& spec, char ch);
    static RTFMT_API ErrorCode format_double(Writer& w, FormatSpec const& spec, double x);

    template <typename T>
    static inline ErrorCode format_int(Writer& w, FormatSpec const& spec, T value)
    {
        static_assert(std::is_integral<T>::value, "T must be an integral type");
        return format_int(w, spec, value, std::is_signed<T>{});
    }

private:
    template <typename T>
    static inline ErrorCode format_int(Writer& w, FormatSpec const& spec, T value, /*is_signed*/ std::true_type) {
        return format_int(w, spec, value, static_cast<typename std::make_unsigned<T>::type>(value));
    }

    template <typename T>
    static inline ErrorCode format_int(Writer& w, FormatSpec const& spec, T value, /*is_signed*/ std::false_type) {
        return format_int(w, spec, 0, value);
    }
};

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

//
// Provides the member constant value equal to true if objects of type T should
// be treated as strings by the Format library.
// Objects of type T must have member functions data() and size() and their
// return values must be convertible to 'char const*' and 'size_t' resp.
//
template <typename T>
struct TreatAsString : std::false_type {};

#if RTFMT_HAS_STD_STRING_VIEW
template <>
struct TreatAsString< std::string_view >
    : std::true_type
{
};
#elif RTFMT_HAS_STD_EXPERIMENTAL_STRING_VIEW
template <>
struct TreatAsString< std::experimental::string_view >
    : std::true_type
{
};
#else
template <>
struct TreatAsString< StringView >
    : std::true_type
{
};
#endif

template <typename Alloc>
struct TreatAsString< std::basic_string<char, std::char_traits<char>, Alloc> >
    : std::true_type
{
};

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

class Arg;
class ArgList;
class Arguments;

namespace impl
{
    // The second template parameter is used in Format_ostream.h to "specialize"
    // this class template for all T's.
    template <typename T, typename = void>
    struct StreamValue
    {
        static_assert(sizeof(T) == 0,
            "Formatting objects of type T is not supported. "
            "Specialize FormatValue or TreatAsString, or, if objects of type T "
            "can be formatted using 'operator<<(std::ostream, T const&)', "
            "include 'Format_ostream.h'.");
    };
}

//
// Specialize this to format user-defined types.
//
template <typename T = void, typename /*XXX Internal. Do not use. XXX*/ = void>
struct FormatValue : impl::StreamValue<T>
{
};

template <typename T>
struct FormatValue<T, typename std::enable_if< TreatAsString<T>::value >::type>
{
    ErrorCode operator()(Writer& w, FormatSpec const& spec, T const& val) const {
        return Util::format_string(w, spec, val.data(), val.size());
    }
};

template <>
struct FormatValue<char const*> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, char const* val) const {
        return Util::format_string(w, spec, val);
    }
};

template <>
struct FormatValue<char*> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, char* val) const {
        return Util::format_string(w, spec, val);
    }
};

template <>
struct FormatValue<bool> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, bool val) const {
        return Util::format_bool(w, spec, val);
    }
};

template <>
struct FormatValue<char> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, char val) const {
        return Util::format_char(w, spec, val);
    }
};

template <>
struct FormatValue<signed char> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, signed char val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<signed short> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, signed short val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<signed int> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, signed int val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<signed long> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, signed long val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<signed long long> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, signed long long val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<unsigned char> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, unsigned char val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<unsigned short> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, unsigned short val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<unsigned int> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, unsigned int val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<unsigned long> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, unsigned long val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<unsigned long long> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, unsigned long long val) const {
        return Util::format_int(w, spec, val);
    }
};

template <>
struct FormatValue<double> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, double val) const {
        return Util::format_double(w, spec, val);
    }
};

template <>
struct FormatValue<float> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, float val) const {
        return Util::format_double(w, spec, static_cast<double>(val));
    }
};

template <>
struct FormatValue<void>
{
    template <typename T>
    ErrorCode operator()(Writer& w, FormatSpec const& spec, T const& val) const {
        return FormatValue<typename std::decay<T>::type>{}(w, spec, val);
    }
};

template <
    typename WriterT,
    typename T,
    typename = typename std::enable_if< std::is_base_of<Writer, typename std::remove_reference<WriterT>::type>::value >::type
>
ErrorCode format_value(WriterT&& w, FormatSpec const& spec, T const& value) {
    return FormatValue<>{}(w, spec, value);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

namespace impl {

using FormatFunc = ErrorCode (*)(Writer& w, FormatSpec const& spec, void const* value);

template <typename T>
ErrorCode FormatValue_fn(Writer& w, FormatSpec const& spec, void const* value)
{
    return ::rtfmt::format_value(w, spec, *static_cast<T const*>(value));
}

// Types which an Arg stores by value (or which only refer to storage owned by
// someone else) and which may therefore be passed as rvalues.
template <typename T> struct IsSafeRValueType                     : std::false_type {};
template <>           struct IsSafeRValueType<StringView        > : std::true_type {};
template <>           struct IsSafeRValueType<char const*       > : std::true_type {};
template <>           struct IsSafeRValueType<char*             > : std::true_type {};
template <>           struct IsSafeRValueType<bool              > : std::true_type {};
template <>           struct IsSafeRValueType<char              > : std::true_type {};
template <>           struct IsSafeRValueType<signed char       > : std::true_type {};
template <>           struct IsSafeRValueType<signed short      > : std::true_type {};
template <>           struct IsSafeRValueType<signed int        > : std::true_type {};
template <>           struct IsSafeRValueType<signed long       > : std::true_type {};
template <>           struct IsSafeRValueType<signed long long  > : std::true_type {};
template <>           struct IsSafeRValueType<unsigned char     > : std::true_type {};
template <>           struct IsSafeRValueType<unsigned short    > : std::true_type {};
template <>           struct IsSafeRValueType<unsigned int      > : std::true_type {};
template <>           struct IsSafeRValueType<unsigned long     > : std::true_type {};
template <>           struct IsSafeRValueType<unsigned long long> : std::true_type {};
template <>           struct IsSafeRValueType<double            > : std::true_type {};
template <>           struct IsSafeRValueType<float             > : std::true_type {};
template <>           struct IsSafeRValueType<Arg               > : std::true_type {};

} // namespace impl

// A type-erased reference to a single formatting argument.
//
// Built-in scalars and C strings are stored by value. Strings are stored as
// pointer and length, all other types as a pointer to the object and the
// FormatValue<T> function which renders it. The referenced objects must
// outlive the Arg.
class Arg
{
    enum Type : unsigned char {
        T_STRING,
        T_OTHER,
        T_PCHAR,
        T_BOOL,
        T_CHAR,
        T_SLONGLONG,
        T_ULONGLONG,
        T_DOUBLE,
    };

    struct String { char const* data; size_t size; };
    struct Other { void const* value; impl::FormatFunc func; };

    union {
        String             string_;
        Other              other_;
        char const*        pchar_;
        bool               bool_;
        char               char_;
        signed long long   slonglong_;
        unsigned long long ulonglong_;
        double             double_;
    };
    Type type_;

    template <typename T> Arg(T const& v, /*IsString*/ std::true_type) : string_{v.data(), v.size()}, type_(T_STRING) {}
    template <typename T> Arg(T const& v, /*IsString*/ std::false_type) : other_{&v, &impl::FormatValue_fn<T>}, type_(T_OTHER)
    {
        static_assert(
            !std::is_function<T>::value,
            "Formatting function types is not supported");
        static_assert(
            !std::is_pointer<T>::value && !std::is_member_pointer<T>::value,
            "Formatting non-char pointer types is not allowed. "
            "A cast to intptr_t is required.");
        static_assert(
            !std::is_same<ArgList, T>::value,
            "Formatting an ArgList in combination with other arguments is not supported. "
            "The only valid syntax for ArgList is as a single argument to the formatting functions.");
    }

public:
    template <typename T>
    Arg(T                  const& v) : Arg(v, TreatAsString<typename std::decay<T>::type>{}) {}
    Arg(char const*        const& v) : pchar_(v), type_(T_PCHAR) {}
    Arg(char*              const& v) : pchar_(v), type_(T_PCHAR) {}
    Arg(bool               const& v) : bool_(v), type_(T_BOOL) {}
    Arg(char               const& v) : char_(v), type_(T_CHAR) {}
    Arg(signed char        const& v) : slonglong_(v), type_(T_SLONGLONG) {}
    Arg(signed short       const& v) : slonglong_(v), type_(T_SLONGLONG) {}
    Arg(signed int         const& v) : slonglong_(v), type_(T_SLONGLONG) {}
    Arg(signed long        const& v) : slonglong_(v), type_(T_SLONGLONG) {}
    Arg(signed long long   const& v) : slonglong_(v), type_(T_SLONGLONG) {}
    Arg(unsigned char      const& v) : ulonglong_(v), type_(T_ULONGLONG) {}
    Arg(unsigned short     const& v) : ulonglong_(v), type_(T_ULONGLONG) {}
    Arg(unsigned int       const& v) : ulonglong_(v), type_(T_ULONGLONG) {}
    Arg(unsigned long      const& v) : ulonglong_(v), type_(T_ULONGLONG) {}
    Arg(unsigned long long const& v) : ulonglong_(v), type_(T_ULONGLONG) {}
    Arg(double             const& v) : double_(v), type_(T_DOUBLE) {}
    Arg(float              const& v) : double_(static_cast<double>(v)), type_(T_DOUBLE) {}

    // The Arg would point to a temporary.
    template <
        typename T,
        typename = typename std::enable_if<
            !std::is_lvalue_reference<T>::value &&
            !impl::IsSafeRValueType<typename std::decay<T>::type>::value
        >::type
    >
    Arg(T&& v) = delete;

    // Renders the referenced value.
    RTFMT_API ErrorCode render(Writer& w, FormatSpec const& spec) const;
};

template <>
struct FormatValue<Arg> {
    ErrorCode operator()(Writer& w, FormatSpec const& spec, Arg const& val) const {
        return val.render(w, spec);
    }
};

// A borrowed view of an ordered, random-access sequence of formatting
// arguments.
//
// The elements are either Arg's (heterogeneous lists) or values of a single
// type T for which FormatValue<T> is defined. The sequence must outlive the
// ArgList.
class ArgList
{
    char const*      first_  = nullptr;
    size_t           size_   = 0;
    size_t           stride_ = 0;
    impl::FormatFunc func_   = nullptr;

public:
    ArgList() = default;

    template <typename T>
    ArgList(T const* first, size_t size)
        : first_(reinterpret_cast<char const*>(first))
        , size_(size)
        , stride_(sizeof(T))
        , func_(&impl::FormatValue_fn<T>)
    {
        assert(size_ == 0 || first_ != nullptr);
    }

    template <typename T, size_t N>
    explicit ArgList(T const (&arr)[N]) : ArgList(&arr[0], N)
    {
    }

    // Any container with contiguous storage, e.g. std::vector or std::array.
    template <
        typename C,
        typename DataT = decltype(std::declval<C const&>().data()),
        typename SizeT = decltype(std::declval<C const&>().size()),
        typename = typename std::enable_if<
            std::is_pointer<DataT>::value &&
            std::is_convertible<SizeT, size_t>::value
        >::type
    >
    explicit ArgList(C const& c) : ArgList(c.data(), static_cast<size_t>(c.size()))
    {
    }

    // Returns the number of arguments.
    size_t size() const { return size_; }

    // Returns whether the list is empty.
    bool empty() const { return size_ == 0; }

    // Renders the argument at the given index.
    // PRE: index < size()
    ErrorCode render(size_t index, Writer& w, FormatSpec const& spec) const
    {
        assert(index < size_);
        return func_(w, spec, first_ + index * stride_);
    }
};

// A format string bound to its arguments.
// May itself be used as an argument. Both the format string and the
// arguments are borrowed.
class Arguments
{
    StringView format_;
    ArgList    args_;

public:
    Arguments(StringView format, ArgList const& args) : format_(format), args_(args) {}

    StringView format() const { return format_; }
    ArgList const& args() const { return args_; }
};

inline Arguments make_arguments(StringView format, ArgList const& args)
{
    return Arguments(format, args);
}

// Returned by the format_to_chars function (below).
// Like std::to_chars.
struct ToCharsResult
{
    char*     next = nullptr;
    ErrorCode ec   = ErrorCode::success;

    ToCharsResult() = default;
    ToCharsResult(char* next_, ErrorCode ec_) : next(next_), ec(ec_) {}

    // Test for successful conversions
    explicit operator bool() const { return ec == ErrorCode::success; }
};

namespace impl {

template <size_t N>
using ArgArray = typename std::conditional< N != 0, Arg[], Arg* >::type;

RTFMT_API ErrorCode DoFormat(Writer& w, StringView format, ArgList const& args);
RTFMT_API ErrorCode DoFormat(std::FILE* file, StringView format, ArgList const& args);

RTFMT_API ToCharsResult DoFormatToChars(char* first, char* last, StringView format, ArgList const& args);

} // namespace impl

template <>
struct FormatValue<Arguments> {
    // Width and precision do not apply to the nested template.
    ErrorCode operator()(Writer& w, FormatSpec const& /*spec*/, Arguments const& val) const {
        return ::rtfmt::impl::DoFormat(w, val.format(), val.args());
    }
};

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

inline ErrorCode format(Writer& w, StringView format, ArgList const& args)
{
    return ::rtfmt::impl::DoFormat(w, format, args);
}

template <typename ...Args>
inline ErrorCode format(Writer& w, StringView format, Args const&... args)
{
    impl::ArgArray<sizeof...(Args)> arr = {args...};
    return ::rtfmt::impl::DoFormat(w, format, ArgList(arr, sizeof...(Args)));
}

inline ErrorCode format(std::FILE* file, StringView format, ArgList const& args)
{
    return ::rtfmt::impl::DoFormat(file, format, args);
}

template <typename ...Args>
inline ErrorCode format(std::FILE* file, StringView format, Args const&... args)
{
    impl::ArgArray<sizeof...(Args)> arr = {args...};
    return ::rtfmt::impl::DoFormat(file, format, ArgList(arr, sizeof...(Args)));
}

inline ToCharsResult format_to_chars(char* first, char* last, StringView format, ArgList const& args)
{
    return ::rtfmt::impl::DoFormatToChars(first, last, format, args);
}

template <typename ...Args>
inline ToCharsResult format_to_chars(char* first, char* last, StringView format, Args const&... args)
{
    impl::ArgArray<sizeof...(Args)> arr = {args...};
    return ::rtfmt::impl::DoFormatToChars(first, last, format, ArgList(arr, sizeof...(Args)));
}

} // namespace rtfmt

#endif // RTFMT_FORMAT_H
