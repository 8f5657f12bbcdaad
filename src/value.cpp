#include "jsonstream/value.hpp"

#include <stdexcept>
#include <type_traits>


namespace JsonStream {

    namespace {

        const value& null_value() {
            static const value v{};
            return v;
        }

    }

    value::value(std::pmr::memory_resource* res) noexcept : m_MemRes{ res } {}
    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept : m_MemRes{ res } {}
    value::value(bool b, std::pmr::memory_resource* res) noexcept : m_MemRes{ res }, m_Storage{ b } {}
    value::value(number n, std::pmr::memory_resource* res) noexcept : m_MemRes{ res }, m_Storage{ n } {}
    value::value(double d, std::pmr::memory_resource* res) noexcept : m_MemRes{ res }, m_Storage{ number{ d } } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : value{ std::string_view{ s }, res } {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, sv, res } {}

    // Containers passed in may carry a different resource; re-home them so
    // the whole subtree allocates from `res`.
    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, std::move(s), res } {}

    value::value(array a, std::pmr::memory_resource* res)
        : m_MemRes{ res } {
        if (a.get_allocator().resource() == res) m_Storage = std::move(a);
        else m_Storage = clone_storage(storage_t{ std::move(a) }, res);
    }

    value::value(object o, std::pmr::memory_resource* res)
        : m_MemRes{ res } {
        if (o.get_allocator().resource() == res) m_Storage = std::move(o);
        else m_Storage = clone_storage(storage_t{ std::move(o) }, res);
    }

    value::value(const value& other) : value{ other, other.m_MemRes } {}

    value::value(const value& other, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ clone_storage(other.m_Storage, res) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    value& value::operator=(const value& other) {
        if (this != &other) {
            // clone first: `other` may live inside our own tree
            storage_t copy = clone_storage(other.m_Storage, other.m_MemRes);
            m_MemRes = other.m_MemRes;
            m_Storage = std::move(copy);
        }
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this != &other) {
            storage_t taken = std::move(other.m_Storage);
            m_MemRes = other.m_MemRes;
            m_Storage = std::move(taken);
        }
        return *this;
    }

    kind value::type() const noexcept {
        // alternatives are declared in `kind` order
        return static_cast<kind>(m_Storage.index());
    }

    bool& value::as_bool() { return std::get<bool>(m_Storage); }
    const bool& value::as_bool() const { return std::get<bool>(m_Storage); }
    number& value::as_number() { return std::get<number>(m_Storage); }
    const number& value::as_number() const { return std::get<number>(m_Storage); }
    string& value::as_string() { return std::get<string>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }

    array& value::as_array() {
        if (auto* arr = std::get_if<array>(&m_Storage)) return *arr;
        return m_Storage.emplace<array>(allocator_type{ m_MemRes });
    }
    const array& value::as_array() const { return std::get<array>(m_Storage); }

    object& value::as_object() {
        if (auto* obj = std::get_if<object>(&m_Storage)) return *obj;
        return m_Storage.emplace<object>(allocator_type{ m_MemRes });
    }
    const object& value::as_object() const { return std::get<object>(m_Storage); }

    size_t value::size() const noexcept {
        return std::visit([](const auto& v) -> size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, array> || std::is_same_v<T, object>) return v.size();
            else return 0;
        }, m_Storage);
    }

    value& value::operator[](std::size_t idx) {
        auto& arr = as_array();
        while (arr.size() <= idx) arr.emplace_back(m_MemRes);
        return arr[idx];
    }

    const value& value::operator[](std::size_t idx) const {
        const auto* arr = std::get_if<array>(&m_Storage);
        if (!arr || idx >= arr->size()) return null_value();
        return (*arr)[idx];
    }

    value& value::operator[](std::string_view key) {
        auto& obj = as_object();
        if (auto it = obj.find(key); it != obj.end()) return it->second;
        return obj.try_emplace(string{ key, m_MemRes }, m_MemRes).first->second;
    }

    const value* value::find(std::string_view key) const {
        const auto* obj = std::get_if<object>(&m_Storage);
        if (!obj) return nullptr;
        auto it = obj->find(key);
        return it == obj->end() ? nullptr : &it->second;
    }

    const value& value::at(std::string_view key) const {
        if (const auto* v = find(key)) return *v;
        throw std::out_of_range{ "JsonStream::value::at: no member named '" + std::string{ key } + "'" };
    }

    bool operator==(const value& lhs, const value& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        return std::visit([res](const auto& v) -> storage_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, string>) {
                return string{ v, res };
            } else if constexpr (std::is_same_v<T, array>) {
                array copy(allocator_type{ res });
                copy.reserve(v.size());
                for (const auto& elem : v) copy.emplace_back(elem, res);
                return copy;
            } else if constexpr (std::is_same_v<T, object>) {
                object copy{ std::less<>{}, res };
                for (const auto& [k, member] : v)
                    copy.try_emplace(string{ k, res }, member, res);
                return copy;
            } else {
                return v;
            }
        }, s);
    }

} // namespace JsonStream
