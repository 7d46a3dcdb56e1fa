// pylit::Value - an immutable Python literal value for C++
#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <gmpxx.h>

namespace pylit {

class Value;

using Bytes = std::vector<std::uint8_t>;

struct Tuple {
    std::vector<Value> items;
};

struct List {
    std::vector<Value> items;
};

// Distinct elements in first-seen order.
struct Set {
    std::vector<Value> items;
};

// Key/value pairs in insertion order, keys distinct.
struct Dict {
    std::vector<std::pair<Value, Value>> items;
};

class Value {
  public:
    // Keep the order in sync with variant_t.
    enum class Kind { None, Boolean, Integer, Float, Complex, Bytes, String, Tuple, List, Set, Dict };

    using variant_t = std::variant<std::monostate, bool, mpz_class, double, std::complex<double>, Bytes,
                                   std::string, Tuple, List, Set, Dict>;

    Value() = default;
    Value(bool b) : v(b) {}
    Value(int x) : v(mpz_class(static_cast<long>(x))) {}
    Value(long x) : v(mpz_class(x)) {}
    Value(unsigned x) : v(mpz_class(static_cast<unsigned long>(x))) {}
    Value(unsigned long x) : v(mpz_class(x)) {}
    // gmpxx has no long long constructors
    Value(long long x) : v(mpz_class(std::to_string(x), 10)) {}
    Value(unsigned long long x) : v(mpz_class(std::to_string(x), 10)) {}
    Value(const mpz_class& x) : v(x) {}
    Value(mpz_class&& x) : v(std::move(x)) {}
    Value(double x) : v(x) {}
    Value(std::complex<double> z) : v(z) {}
    Value(const Bytes& b) : v(b) {}
    Value(Bytes&& b) : v(std::move(b)) {}
    // Strings must be valid UTF-8 without surrogates; throws std::invalid_argument.
    Value(const char* s);
    Value(std::string s);
    Value(Tuple t) : v(std::move(t)) {}
    Value(List l) : v(std::move(l)) {}
    Value(Set s);
    Value(Dict d);

    static Value none() { return Value(); }

    Kind kind() const noexcept { return static_cast<Kind>(v.index()); }
    const variant_t& data() const noexcept { return v; }

    bool is_none() const noexcept { return std::holds_alternative<std::monostate>(v); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(v); }
    bool is_integer() const noexcept { return std::holds_alternative<mpz_class>(v); }
    bool is_float() const noexcept { return std::holds_alternative<double>(v); }
    bool is_complex() const noexcept { return std::holds_alternative<std::complex<double>>(v); }
    bool is_bytes() const noexcept { return std::holds_alternative<Bytes>(v); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_tuple() const noexcept { return std::holds_alternative<Tuple>(v); }
    bool is_list() const noexcept { return std::holds_alternative<List>(v); }
    bool is_set() const noexcept { return std::holds_alternative<Set>(v); }
    bool is_dict() const noexcept { return std::holds_alternative<Dict>(v); }
    bool is_number() const noexcept { return is_integer() || is_float() || is_complex(); }

    bool as_bool() const { return std::get<bool>(v); }
    const mpz_class& as_integer() const { return std::get<mpz_class>(v); }
    double as_float() const { return std::get<double>(v); }
    std::complex<double> as_complex() const { return std::get<std::complex<double>>(v); }
    const Bytes& as_bytes() const { return std::get<Bytes>(v); }
    const std::string& as_string() const { return std::get<std::string>(v); }
    const Tuple& as_tuple() const { return std::get<Tuple>(v); }
    const List& as_list() const { return std::get<List>(v); }
    const Set& as_set() const { return std::get<Set>(v); }
    const Dict& as_dict() const { return std::get<Dict>(v); }

    // Number of elements for collections, bytes for Bytes and String, 0 otherwise.
    size_t size() const noexcept;

    // Element access for Tuple, List and Set. Throws std::out_of_range.
    const Value& at(size_t idx) const;
    // Dict lookup by structural key equality.
    const Value* find(const Value& key) const;
    const Value& at(const Value& key) const;
    // Membership for Set elements and Dict keys; false for other kinds.
    bool contains(const Value& item) const;

    std::string to_string() const;

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }

  private:
    variant_t v;
};

// Python type name of a kind: "NoneType", "int", "str", ...
const char* kind_name(Value::Kind k) noexcept;

std::ostream& operator<<(std::ostream& os, const Value& v);

}  // namespace pylit
