#include <pylit/value.h>
#include <pylit/format.h>
#include <pylit/detail/utf8.h>
#include <algorithm>
#include <cstring>
#include <map>
#include <set>
#include <stdexcept>

namespace pylit {

namespace {
    uint64_t bits_of(double d) {
        uint64_t x;
        std::memcpy(&x, &d, sizeof x);
        return x;
    }

    bool same_bits(double a, double b) { return bits_of(a) == bits_of(b); }

    template <typename T>
    int three_way(const T& a, const T& b) {
        if (a < b) return -1;
        if (b < a) return 1;
        return 0;
    }

    int compare(const Value& a, const Value& b);

    // Strict weak order over values that agrees with operator==.
    struct ValueLess {
        bool operator()(const Value* a, const Value* b) const { return compare(*a, *b) < 0; }
    };

    int compare_items(const std::vector<Value>& a, const std::vector<Value>& b) {
        size_t n = std::min(a.size(), b.size());
        for (size_t k = 0; k < n; ++k) {
            int r = compare(a[k], b[k]);
            if (r != 0) return r;
        }
        return three_way(a.size(), b.size());
    }

    // Set elements compared in sorted order, so element order does not matter.
    int compare_sets(const std::vector<Value>& a, const std::vector<Value>& b) {
        if (a.size() != b.size()) return three_way(a.size(), b.size());
        std::vector<const Value*> x, y;
        for (auto const& e : a) x.push_back(&e);
        for (auto const& e : b) y.push_back(&e);
        std::sort(x.begin(), x.end(), ValueLess{});
        std::sort(y.begin(), y.end(), ValueLess{});
        for (size_t k = 0; k < x.size(); ++k) {
            int r = compare(*x[k], *y[k]);
            if (r != 0) return r;
        }
        return 0;
    }

    int compare(const Value& a, const Value& b) {
        if (a.kind() != b.kind()) return three_way(a.kind(), b.kind());
        switch (a.kind()) {
            case Value::Kind::None: return 0;
            case Value::Kind::Boolean: return three_way(a.as_bool(), b.as_bool());
            case Value::Kind::Integer: return three_way(cmp(a.as_integer(), b.as_integer()), 0);
            case Value::Kind::Float: return three_way(bits_of(a.as_float()), bits_of(b.as_float()));
            case Value::Kind::Complex: {
                auto x = a.as_complex(), y = b.as_complex();
                int r = three_way(bits_of(x.real()), bits_of(y.real()));
                return r != 0 ? r : three_way(bits_of(x.imag()), bits_of(y.imag()));
            }
            case Value::Kind::Bytes: return three_way(a.as_bytes(), b.as_bytes());
            case Value::Kind::String: return three_way(a.as_string().compare(b.as_string()), 0);
            case Value::Kind::Tuple: return compare_items(a.as_tuple().items, b.as_tuple().items);
            case Value::Kind::List: return compare_items(a.as_list().items, b.as_list().items);
            case Value::Kind::Set: return compare_sets(a.as_set().items, b.as_set().items);
            case Value::Kind::Dict: {
                const auto& x = a.as_dict().items;
                const auto& y = b.as_dict().items;
                size_t n = std::min(x.size(), y.size());
                for (size_t k = 0; k < n; ++k) {
                    int r = compare(x[k].first, y[k].first);
                    if (r == 0) r = compare(x[k].second, y[k].second);
                    if (r != 0) return r;
                }
                return three_way(x.size(), y.size());
            }
        }
        return 0;
    }

    bool contains_item(const std::vector<Value>& items, const Value& item) {
        for (auto const& e : items)
            if (e == item) return true;
        return false;
    }
}

Value::Value(const char* s) : Value(std::string(s)) {}

Value::Value(std::string s) {
    if (!detail::is_valid_utf8(s)) throw std::invalid_argument("string is not valid UTF-8");
    v = std::move(s);
}

// The index holds pointers into out.items, which never reallocates after reserve().
Value::Value(Set s) {
    Set out;
    out.items.reserve(s.items.size());
    std::set<const Value*, ValueLess> seen;
    for (auto& e : s.items) {
        if (seen.count(&e) != 0) continue;
        out.items.push_back(std::move(e));
        seen.insert(&out.items.back());
    }
    v = std::move(out);
}

Value::Value(Dict d) {
    Dict out;
    out.items.reserve(d.items.size());
    std::map<const Value*, size_t, ValueLess> index;
    for (auto& kv : d.items) {
        auto it = index.find(&kv.first);
        if (it != index.end()) {
            out.items[it->second].second = std::move(kv.second);
            continue;
        }
        out.items.push_back(std::move(kv));
        index.emplace(&out.items.back().first, out.items.size() - 1);
    }
    v = std::move(out);
}

size_t Value::size() const noexcept {
    switch (kind()) {
        case Kind::Bytes: return as_bytes().size();
        case Kind::String: return as_string().size();
        case Kind::Tuple: return as_tuple().items.size();
        case Kind::List: return as_list().items.size();
        case Kind::Set: return as_set().items.size();
        case Kind::Dict: return as_dict().items.size();
        default: return 0;
    }
}

const Value& Value::at(size_t idx) const {
    const std::vector<Value>* items = nullptr;
    if (is_tuple())
        items = &as_tuple().items;
    else if (is_list())
        items = &as_list().items;
    else if (is_set())
        items = &as_set().items;
    else
        throw std::out_of_range(std::string("not a sequence: ") + kind_name(kind()));
    if (idx >= items->size()) throw std::out_of_range("index out of range");
    return (*items)[idx];
}

const Value* Value::find(const Value& key) const {
    if (!is_dict()) return nullptr;
    for (auto const& kv : as_dict().items)
        if (kv.first == key) return &kv.second;
    return nullptr;
}

const Value& Value::at(const Value& key) const {
    if (!is_dict()) throw std::out_of_range(std::string("not a dict: ") + kind_name(kind()));
    const Value* found = find(key);
    if (found == nullptr) throw std::out_of_range("key not found: " + key.to_string());
    return *found;
}

bool Value::contains(const Value& item) const {
    if (is_set()) return contains_item(as_set().items, item);
    if (is_dict()) return find(item) != nullptr;
    return false;
}

std::string Value::to_string() const { return format(*this); }

bool Value::operator==(const Value& o) const {
    if (kind() != o.kind()) return false;
    switch (kind()) {
        case Kind::None: return true;
        case Kind::Boolean: return as_bool() == o.as_bool();
        case Kind::Integer: return as_integer() == o.as_integer();
        case Kind::Float: return same_bits(as_float(), o.as_float());
        case Kind::Complex: {
            auto a = as_complex(), b = o.as_complex();
            return same_bits(a.real(), b.real()) and same_bits(a.imag(), b.imag());
        }
        case Kind::Bytes: return as_bytes() == o.as_bytes();
        case Kind::String: return as_string() == o.as_string();
        case Kind::Tuple: return as_tuple().items == o.as_tuple().items;
        case Kind::List: return as_list().items == o.as_list().items;
        case Kind::Set: return compare_sets(as_set().items, o.as_set().items) == 0;
        case Kind::Dict: return as_dict().items == o.as_dict().items;
    }
    return false;
}

const char* kind_name(Value::Kind k) noexcept {
    switch (k) {
        case Value::Kind::None: return "NoneType";
        case Value::Kind::Boolean: return "bool";
        case Value::Kind::Integer: return "int";
        case Value::Kind::Float: return "float";
        case Value::Kind::Complex: return "complex";
        case Value::Kind::Bytes: return "bytes";
        case Value::Kind::String: return "str";
        case Value::Kind::Tuple: return "tuple";
        case Value::Kind::List: return "list";
        case Value::Kind::Set: return "set";
        case Value::Kind::Dict: return "dict";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Value& v) { return os << format(v); }

}  // namespace pylit
