#pragma once


/*
    ----------------------------------------
    JsonStream::value - Assembled JSON value
    ----------------------------------------
    The `JsonStream::value` type represents any JSON value:
        - null
        - boolean
        - number (see `number.hpp`)
        - string
        - array
        - object
    It is what the assembler and the grouper build from an event stream,
    and what an event carries as its leaf (a scalar, or an empty
    container for the empty-container marker)

    ----------------
    Allocation Model
    ----------------
    A `value` remembers the `std::pmr::memory_resource` it was built with,
    and every string, array and object it owns comes from that resource.
    The assembler builds a whole tree on the resource of its root, so a
    `std::pmr::monotonic_buffer_resource` per document releases the tree
    in one step.
    - Copies are deep. Plain copies keep the source's resource;
      `value(other, res)` re-homes the tree onto `res`
    - Moves take the storage and the resource with them

    ----------------
    Building by Path
    ----------------
    The non-const accessors convert in place, which is what merging an
    event path into a partial tree needs:
    - `as_array()` / `as_object()` replace any other kind with an empty
      container
    - `operator[](size_t)` grows the array to `idx + 1`, padding with `null`
    - `operator[](std::string_view)` inserts a `null` member when the key
      is missing
    Const access never converts or inserts: `operator[] const` returns a
    shared `null` when there is nothing there, `find` returns nullptr and
    `at` throws `std::out_of_range`.
    Scalar accessors (`as_bool`, `as_number`, `as_string`) throw
    `std::bad_variant_access` on a kind mismatch.

    Equality is structural. Objects are key-sorted, so member order
    never matters, and the memory resource is not compared.

    A single `value` must not be mutated from several threads at once.
*/

/// @defgroup JsonStream JsonStream Incremental JSON Library
/// @brief Core types and functions for JsonStream

/// @defgroup JsonStreamValue Assembled Value
/// @ingroup JsonStream

#include <variant>
#include <string>
#include <vector>
#include <map>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <string_view>
#include <utility>
#include "jsonstream/config.hpp"
#include "jsonstream/number.hpp"

namespace JsonStream {
    /// @brief Enumerates the possible JSON value kinds held by JsonStream::value
    enum class kind : uint8_t {
        null, ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        number, ///< JSON number value
        string, ///< JSON string value
        array, ///< JSON array value
        object, ///< JSON object value
    };


    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    template<class Key, class T, class Compare = std::less<>>
    using pmr_map = std::pmr::map<Key, T, Compare>;

    /// @ingroup JsonStreamValue
    /// @brief String type used by JsonStream::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup JsonStreamValue
    /// @brief Array type used by JsonStream::value (JSON arrays)
    using array = pmr_vector<value>;

    /// @ingroup JsonStreamValue
    /// @brief Object type used by JsonStream::value (JSON objects)
    using object = pmr_map<string, value>;

    /// @ingroup JsonStreamValue
    /// @brief Variant storage used internally by JsonStream::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        number,
        string,
        array,
        object
    >;


    /// @ingroup JsonStreamValue
    /// @brief Dynamic JSON value, built by the assembler and the grouper.
    ///
    /// @details
    /// All nested allocations (string, arrays, objects) are performed using
    /// a `std::pmr::memory_resource` associated with each `value` instance.
    /// Container-like operations (e.g. `as_array`, `as_object`, `operator[]`)
    /// use this allocator
    struct value {
        // ------------------------------------------------------------
        // Construction
        // ------------------------------------------------------------
        // Every constructor takes the memory resource last; nested strings
        // and containers are allocated from it.

        /// @ingroup JsonStreamValue
        /// @brief Constructs `null`
        JSONSTREAM_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        JSONSTREAM_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        JSONSTREAM_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        JSONSTREAM_API value(number n, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup JsonStreamValue
        /// @brief Constructs a non-integral number
        JSONSTREAM_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup JsonStreamValue
        /// @brief Constructs an exact integral number; `bool` is excluded
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ number{ i } } {}

        /// @ingroup JsonStreamValue
        /// @brief Constructs a string; the characters are copied into `res`
        JSONSTREAM_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        JSONSTREAM_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        JSONSTREAM_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        JSONSTREAM_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        JSONSTREAM_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup JsonStreamValue
        /// @brief Deep copy that keeps the resource of @p other
        JSONSTREAM_API value(const value& other);

        /// @ingroup JsonStreamValue
        /// @brief Deep copy of @p other with every node allocated from @p res
        JSONSTREAM_API value(const value& other, std::pmr::memory_resource* res);

        /// @ingroup JsonStreamValue
        /// @brief Takes over the resource and storage of @p other
        JSONSTREAM_API value(value&& other) noexcept;

        JSONSTREAM_API value& operator=(const value& other);
        JSONSTREAM_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @ingroup JsonStreamValue
        /// @brief Returns the kind of JSON value currently stored.
        [[nodiscard]] JSONSTREAM_API kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        /// @ingroup JsonStreamValue
        /// @brief Checks whether the value is null, a boolean, a number or a string
        [[nodiscard]] bool is_scalar() const noexcept { return !is_array() && !is_object(); }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        /// @ingroup JsonStreamValue
        /// @brief Returns a reference to the stored boolean value
        /// @throws std::bad_variant_access if `is_bool()` is false
        [[nodiscard]] JSONSTREAM_API bool&       as_bool();
        [[nodiscard]] JSONSTREAM_API const bool& as_bool() const;

        /// @ingroup JsonStreamValue
        /// @brief Returns a reference to the stored number value
        /// @throws std::bad_variant_access if `is_number()` is false
        [[nodiscard]] JSONSTREAM_API number&       as_number();
        [[nodiscard]] JSONSTREAM_API const number& as_number() const;

        /// @ingroup JsonStreamValue
        /// @brief Returns a reference to the stored string value
        /// @throws std::bad_variant_access if `is_string()` is false
        [[nodiscard]] JSONSTREAM_API string&       as_string();
        [[nodiscard]] JSONSTREAM_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @ingroup JsonStreamValue
        /// @brief Returns a reference to the stored array value
        /// @details
        /// If `is_array()` is true, returns the existing array.
        /// Otherwise, the current contents are discarded and replaced with
        /// an empty array allocated from `resource()`, and that array is returned
        [[nodiscard]] JSONSTREAM_API array&       as_array();

        /// @ingroup JsonStreamValue
        /// @brief Returns a const reference to the stored array value
        /// @throws std::bad_variant_access if `is_array()` is false
        [[nodiscard]] JSONSTREAM_API const array& as_array() const;

        /// @ingroup JsonStreamValue
        /// @brief Returns a reference to the stored object value
        /// @details
        /// If `is_object()` is true, returns the existing object.
        /// Otherwise, the current contents are discarded and replaced with
        /// an empty object allocated from `resource()`, and that object is returned
        [[nodiscard]] JSONSTREAM_API object&       as_object();

        /// @ingroup JsonStreamValue
        /// @brief Returns a const reference to the stored object value
        /// @throws std::bad_variant_access if `is_object()` is false
        [[nodiscard]] JSONSTREAM_API const object& as_object() const;

        /// @ingroup JsonStreamValue
        /// @brief Returns the size of the array or object
        /// @details
        /// For arrays, this is the number of elements
        /// For objects, this is the number of key/value pairs
        /// For non-container types, returns 0
        [[nodiscard]] JSONSTREAM_API size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @ingroup JsonStreamValue
        /// @brief Accesses or creates an array element by index, growing array as needed
        /// @details
        /// If the current value is **not** an array, it is implicitly converted
        /// into an empty array (`[]`) before access.
        /// If @p idx is greater than or equal to the current array size,
        /// the array is resized to `idx + 1`. All newly created elements are
        /// default-constructed JSON values (`null`).
        JSONSTREAM_API value& operator[](size_t idx);

        /// @ingroup JsonStreamValue
        /// @brief Accesses an array element by index (const overload)
        ///
        /// @details
        /// Unlike the non-const overload, this function does **not**
        /// perform type converion or resizing. A non-array value or an out
        /// of range index yields a reference to a shared `null` value
        JSONSTREAM_API const value& operator[](size_t idx) const;

        /// @ingroup JsonStreamValue
        /// @brief Accesses or creates an object member by key
        ///
        /// @details
        /// If the value is not an object, it is converted to an empty object
        /// If @p key does not exist, a new entry is inserted with a `null` value
        /// Returns a reference to the value associated with @p key
        JSONSTREAM_API value& operator[](std::string_view key);

        /// @ingroup JsonStreamValue
        /// @brief Finds a member with the given key in the object
        ///
        /// @return Pointer to the value mapped to @p key, or nullptr if the
        ///         value is not an object or has no such member
        [[nodiscard]] JSONSTREAM_API const value* find(std::string_view key) const;

        /// @ingroup JsonStreamValue
        /// @brief Returns a const reference to the value associated with @p key
        ///
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        [[nodiscard]] JSONSTREAM_API const value& at(std::string_view key) const;

        /// @ingroup JsonStreamValue
        /// @brief Structural equality; the memory resource is ignored
        JSONSTREAM_API friend bool operator==(const value& lhs, const value& rhs);

        /// @ingroup JsonStreamValue
        /// @brief Returns the memory resource associated with this value
        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }


    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace JsonStream
