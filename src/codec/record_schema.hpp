// src/codec/record_schema.hpp
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "codec/bit_serializable.hpp"
#include "codec/codec_error.hpp"
#include "codec/field_accessor.hpp"
#include "codec/layout_builder.hpp"
#include "codec/layout_cache.hpp"
#include "codec/type_layout.hpp"
#include "codec/value_converter.hpp"
#include "utils/bitpack.hpp"

namespace codec {

template <typename T>
class RecordSchema;

// Cached layout of a described record type. Record types provide
//   static void describe(codec::RecordSchema<T>& s);
template <typename T>
LayoutPtr layout_of();

namespace detail {

// ============================================================================
// Member type classification
// ============================================================================

template <typename M>
struct is_vector : std::false_type {};

template <typename E, typename A>
struct is_vector<std::vector<E, A>> : std::true_type {};

template <typename M>
struct is_std_array : std::false_type {};

template <typename E, size_t N>
struct is_std_array<std::array<E, N>> : std::true_type {};

template <typename M>
struct is_unique_ptr : std::false_type {};

template <typename B, typename D>
struct is_unique_ptr<std::unique_ptr<B, D>> : std::true_type {};

template <typename T, typename = void>
struct has_describe : std::false_type {};

template <typename T>
struct has_describe<T, std::void_t<decltype(T::describe(std::declval<RecordSchema<T>&>()))>>
    : std::true_type {};

template <typename M>
constexpr bool is_scalar_v = std::is_enum<M>::value ||
                             (std::is_integral<M>::value && !std::is_same<M, bool>::value);

template <typename M>
constexpr bool is_list_v = is_vector<M>::value || is_std_array<M>::value;

// Kind of a list element, empty when the element type has no encoding
template <typename E>
std::optional<FieldKind> element_kind_of() {
    if constexpr (std::is_enum<E>::value) {
        return FieldKind::Enum;
    } else if constexpr (is_scalar_v<E>) {
        return FieldKind::Primitive;
    } else if constexpr (has_describe<E>::value && !std::is_base_of<BitSerializable, E>::value) {
        return FieldKind::Nested;
    } else {
        return std::nullopt;
    }
}

// Kind of a record member, empty when the member type has no encoding.
// A type implementing BitSerializable is a generic slot even when it is
// itself described.
template <typename M>
std::optional<FieldKind> kind_of() {
    if constexpr (std::is_enum<M>::value) {
        return FieldKind::Enum;
    } else if constexpr (is_scalar_v<M>) {
        return FieldKind::Primitive;
    } else if constexpr (is_list_v<M>) {
        return FieldKind::List;
    } else if constexpr (is_unique_ptr<M>::value) {
        return FieldKind::Polymorphic;
    } else if constexpr (std::is_base_of<BitSerializable, M>::value) {
        return FieldKind::GenericSlot;
    } else if constexpr (has_describe<M>::value) {
        return FieldKind::Nested;
    } else {
        return std::nullopt;
    }
}

// ============================================================================
// Typed accessors
// ============================================================================

template <typename T, typename M>
class ScalarAccessor : public FieldAccessor {
public:
    explicit ScalarAccessor(M T::*member) : member_(member) {}

    int natural_bits() const override { return utils::natural_bits<M>(); }

    uint64_t get_raw(const void* obj) const override {
        return utils::to_raw_bits(static_cast<const T*>(obj)->*member_);
    }

    void set_raw(void* obj, uint64_t raw) const override {
        static_cast<T*>(obj)->*member_ = utils::from_raw_bits<M>(raw);
    }

    int64_t get_integer(const void* obj) const override {
        using I = typename utils::integral_of<M>::type;
        return static_cast<int64_t>(static_cast<I>(static_cast<const T*>(obj)->*member_));
    }

private:
    M T::*member_;
};

template <typename T, typename M>
class NestedAccessor : public FieldAccessor {
public:
    explicit NestedAccessor(M T::*member) : member_(member) {}

    const void* nested(const void* obj) const override { return &(static_cast<const T*>(obj)->*member_); }
    void* nested_mut(void* obj) const override { return &(static_cast<T*>(obj)->*member_); }

private:
    M T::*member_;
};

template <typename T, typename M>
class GenericAccessor : public FieldAccessor {
public:
    explicit GenericAccessor(M T::*member) : member_(member) {}

    const BitSerializable& generic(const void* obj) const override { return static_cast<const T*>(obj)->*member_; }
    BitSerializable& generic_mut(void* obj) const override { return static_cast<T*>(obj)->*member_; }

private:
    M T::*member_;
};

// std::vector grows to the decoded count; std::array keeps its capacity
template <typename T, typename C>
class ListAccessor : public FieldAccessor {
    using E = typename C::value_type;

public:
    explicit ListAccessor(C T::*member) : member_(member) {}

    size_t size(const void* obj) const override { return list(obj).size(); }

    size_t capacity() const override {
        if constexpr (is_std_array<C>::value) {
            return std::tuple_size<C>::value;
        } else {
            return 0;
        }
    }

    void resize(void* obj, size_t n) const override {
        C& c = list(obj);
        if constexpr (is_std_array<C>::value) {
            if (n > c.size()) {
                throw CodecError(ErrorKind::CountMismatch,
                                 "count " + std::to_string(n) + " exceeds array capacity " +
                                 std::to_string(c.size()));
            }
            for (auto& e : c) {
                e = E{};
            }
        } else {
            c.clear();
            c.resize(n);
        }
    }

    int element_natural_bits() const override {
        if constexpr (is_scalar_v<E>) {
            return utils::natural_bits<E>();
        } else {
            return FieldAccessor::element_natural_bits();
        }
    }

    uint64_t get_element_raw(const void* obj, size_t i) const override {
        if constexpr (is_scalar_v<E>) {
            return utils::to_raw_bits(list(obj)[i]);
        } else {
            return FieldAccessor::get_element_raw(obj, i);
        }
    }

    void set_element_raw(void* obj, size_t i, uint64_t raw) const override {
        if constexpr (is_scalar_v<E>) {
            list(obj)[i] = utils::from_raw_bits<E>(raw);
        } else {
            FieldAccessor::set_element_raw(obj, i, raw);
        }
    }

    const void* element(const void* obj, size_t i) const override { return &list(obj)[i]; }
    void* element_mut(void* obj, size_t i) const override { return &list(obj)[i]; }

private:
    const C& list(const void* obj) const { return static_cast<const T*>(obj)->*member_; }
    C& list(void* obj) const { return static_cast<T*>(obj)->*member_; }

    C T::*member_;
};

// Polymorphic slot held as std::unique_ptr<B>. Variants are added by the
// field builder, in the same order as the layout mappings.
template <typename T, typename B>
class PolyAccessor : public FieldAccessor {
    static_assert(std::has_virtual_destructor<B>::value,
                  "polymorphic slot base type needs a virtual destructor");

public:
    explicit PolyAccessor(std::unique_ptr<B> T::*member) : member_(member) {}

    template <typename D>
    void add_variant() {
        Variant v;
        v.type = std::type_index(typeid(D));
        v.make = [] { return std::unique_ptr<B>(new D()); };
        v.view = [](const B* p) -> const void* { return dynamic_cast<const D*>(p); };
        v.view_mut = [](B* p) -> void* { return dynamic_cast<D*>(p); };
        variants_.push_back(std::move(v));
    }

    int occupant_variant(const void* obj) const override {
        const B* p = slot(obj).get();
        if (!p) {
            return -1;
        }
        const std::type_index dynamic_type(typeid(*p));
        for (size_t i = 0; i < variants_.size(); ++i) {
            if (variants_[i].type == dynamic_type) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    std::string occupant_type_name(const void* obj) const override {
        const B* p = slot(obj).get();
        return p ? typeid(*p).name() : "null";
    }

    const void* occupant(const void* obj, int variant) const override {
        return variants_.at(static_cast<size_t>(variant)).view(slot(obj).get());
    }

    void* emplace_variant(void* obj, int variant) const override {
        const Variant& v = variants_.at(static_cast<size_t>(variant));
        std::unique_ptr<B>& s = static_cast<T*>(obj)->*member_;
        s = v.make();
        return v.view_mut(s.get());
    }

private:
    struct Variant {
        std::type_index type = std::type_index(typeid(void));
        std::function<std::unique_ptr<B>()> make;
        std::function<const void*(const B*)> view;
        std::function<void*(B*)> view_mut;
    };

    const std::unique_ptr<B>& slot(const void* obj) const { return static_cast<const T*>(obj)->*member_; }

    std::unique_ptr<B> T::*member_;
    std::vector<Variant> variants_;
};

// Reaches a base-class field from a pointer to the derived record
template <typename D, typename B>
class UpcastAccessor : public FieldAccessor {
public:
    explicit UpcastAccessor(std::shared_ptr<const FieldAccessor> inner) : inner_(std::move(inner)) {}

    int natural_bits() const override { return inner_->natural_bits(); }
    uint64_t get_raw(const void* obj) const override { return inner_->get_raw(up(obj)); }
    void set_raw(void* obj, uint64_t raw) const override { inner_->set_raw(up(obj), raw); }
    int64_t get_integer(const void* obj) const override { return inner_->get_integer(up(obj)); }

    const void* nested(const void* obj) const override { return inner_->nested(up(obj)); }
    void* nested_mut(void* obj) const override { return inner_->nested_mut(up(obj)); }

    size_t size(const void* obj) const override { return inner_->size(up(obj)); }
    size_t capacity() const override { return inner_->capacity(); }
    void resize(void* obj, size_t n) const override { inner_->resize(up(obj), n); }
    int element_natural_bits() const override { return inner_->element_natural_bits(); }
    uint64_t get_element_raw(const void* obj, size_t i) const override { return inner_->get_element_raw(up(obj), i); }
    void set_element_raw(void* obj, size_t i, uint64_t raw) const override { inner_->set_element_raw(up(obj), i, raw); }
    const void* element(const void* obj, size_t i) const override { return inner_->element(up(obj), i); }
    void* element_mut(void* obj, size_t i) const override { return inner_->element_mut(up(obj), i); }

    int occupant_variant(const void* obj) const override { return inner_->occupant_variant(up(obj)); }
    std::string occupant_type_name(const void* obj) const override { return inner_->occupant_type_name(up(obj)); }
    const void* occupant(const void* obj, int v) const override { return inner_->occupant(up(obj), v); }
    void* emplace_variant(void* obj, int v) const override { return inner_->emplace_variant(up(obj), v); }

    const BitSerializable& generic(const void* obj) const override { return inner_->generic(up(obj)); }
    BitSerializable& generic_mut(void* obj) const override { return inner_->generic_mut(up(obj)); }

private:
    static const void* up(const void* obj) { return static_cast<const B*>(static_cast<const D*>(obj)); }
    static void* up(void* obj) { return static_cast<B*>(static_cast<D*>(obj)); }

    std::shared_ptr<const FieldAccessor> inner_;
};

// ============================================================================
// Converters
// ============================================================================

// C qualifies for a member of type M when it provides
//   static M to_raw(M logical);
//   static M to_logical(M raw);
template <typename C, typename M, typename = void>
struct is_value_converter : std::false_type {};

template <typename C, typename M>
struct is_value_converter<C, M, std::void_t<
    decltype(static_cast<M>(C::to_raw(std::declval<M>()))),
    decltype(static_cast<M>(C::to_logical(std::declval<M>())))>> : std::true_type {};

template <typename C, typename M>
class TypedConverter : public ValueConverter {
public:
    uint64_t to_raw(uint64_t logical) const override {
        return utils::to_raw_bits(static_cast<M>(C::to_raw(utils::from_raw_bits<M>(logical))));
    }

    uint64_t to_logical(uint64_t raw) const override {
        return utils::to_raw_bits(static_cast<M>(C::to_logical(utils::from_raw_bits<M>(raw))));
    }

    std::string name() const override { return typeid(C).name(); }
};

} // namespace detail

// ============================================================================
// Declaration API
// ============================================================================

/**
 * FieldBuilder - refines one field declaration.
 *
 *   s.field("items", &Msg::items).bits(4).count(3);
 *   s.field("payload", &Msg::payload).related("kind")
 *       .variant<PayloadA>(1)
 *       .variant<PayloadB>(2);
 */
template <typename T, typename M>
class FieldBuilder {
public:
    FieldBuilder(RecordDecl& decl, size_t index, std::shared_ptr<FieldAccessor> accessor)
        : decl_(&decl), index_(index), accessor_(std::move(accessor)) {}

    // Encoded width; for lists the width of each element
    FieldBuilder& bits(size_t n) {
        field().bit_length = n;
        return *this;
    }

    // Fixed list cardinality. Takes priority over related().
    FieldBuilder& count(uint32_t n) {
        field().fixed_count = n;
        return *this;
    }

    // Count field of a list, or discriminator field of a polymorphic slot
    FieldBuilder& related(const std::string& name) {
        field().related = name;
        return *this;
    }

    // Excluded from the layout
    FieldBuilder& ignored() {
        field().ignored = true;
        return *this;
    }

    template <typename C>
    FieldBuilder& converter() {
        FieldDecl& fd = field();
        if constexpr (!detail::is_scalar_v<M>) {
            fd.converter_error = "converters apply to Primitive and Enum fields only";
        } else if constexpr (!detail::is_value_converter<C, M>::value) {
            fd.converter_error = std::string(typeid(C).name()) +
                                 " lacks static to_raw/to_logical for the member type";
        } else {
            fd.converter = std::make_shared<detail::TypedConverter<C, M>>();
        }
        return *this;
    }

    template <typename D>
    FieldBuilder& variant(int64_t discriminator) {
        static_assert(detail::is_unique_ptr<M>::value,
                      "variant<D>() applies to std::unique_ptr slots only");
        using B = typename M::element_type;
        static_assert(std::is_base_of<B, D>::value, "variant must derive from the slot's base type");

        std::static_pointer_cast<detail::PolyAccessor<T, B>>(accessor_)->template add_variant<D>();
        field().variants.push_back(VariantDecl{discriminator, [] { return layout_of<D>(); }});
        return *this;
    }

private:
    FieldDecl& field() { return decl_->fields[index_]; }

    RecordDecl* decl_;
    size_t index_;
    std::shared_ptr<FieldAccessor> accessor_;
};

/**
 * RecordSchema - collects the field declarations of record type T.
 *
 * Fields are laid out in the order they are declared. Fields of an
 * extended base type come first.
 */
template <typename T>
class RecordSchema {
public:
    RecordSchema() { decl_.type_name = typeid(T).name(); }

    void name(const std::string& type_name) { decl_.type_name = type_name; }

    template <typename B>
    void extends() {
        static_assert(std::is_base_of<B, T>::value, "extends<B>() needs B to be a base of T");
        if (decl_.base_layout) {
            throw LayoutError(ErrorKind::UnsupportedFieldType, decl_.type_name,
                              "only one base type may be extended");
        }

        RecordSchema<B> base;
        B::describe(base);

        std::vector<FieldDecl> inherited = base.decl().fields;
        for (auto& fd : inherited) {
            if (fd.accessor) {
                fd.accessor = std::make_shared<detail::UpcastAccessor<T, B>>(fd.accessor);
            }
        }
        decl_.fields.insert(decl_.fields.begin(), inherited.begin(), inherited.end());
        decl_.base_layout = [] { return layout_of<B>(); };
    }

    template <typename M>
    FieldBuilder<T, M> field(const std::string& field_name, M T::*member) {
        FieldDecl fd;
        fd.name = field_name;
        fd.type_name = typeid(M).name();
        fd.kind = detail::kind_of<M>();

        std::shared_ptr<FieldAccessor> accessor = make_accessor(fd, member);
        fd.accessor = accessor;
        decl_.fields.push_back(std::move(fd));
        return FieldBuilder<T, M>(decl_, decl_.fields.size() - 1, std::move(accessor));
    }

    const RecordDecl& decl() const { return decl_; }

private:
    template <typename M>
    static std::shared_ptr<FieldAccessor> make_accessor(FieldDecl& fd, M T::*member) {
        if constexpr (detail::is_scalar_v<M>) {
            fd.natural_bits = utils::natural_bits<M>();
            return std::make_shared<detail::ScalarAccessor<T, M>>(member);
        } else if constexpr (detail::is_list_v<M>) {
            using E = typename M::value_type;
            fd.element_kind = detail::element_kind_of<E>();
            fd.is_array_like = detail::is_std_array<M>::value;
            if constexpr (detail::is_std_array<M>::value) {
                fd.capacity = std::tuple_size<M>::value;
            }
            if constexpr (detail::is_scalar_v<E>) {
                fd.natural_bits = utils::natural_bits<E>();
            } else if constexpr (detail::has_describe<E>::value) {
                fd.layout = [] { return layout_of<E>(); };
            }
            return std::make_shared<detail::ListAccessor<T, M>>(member);
        } else if constexpr (detail::is_unique_ptr<M>::value) {
            return std::make_shared<detail::PolyAccessor<T, typename M::element_type>>(member);
        } else if constexpr (std::is_base_of<BitSerializable, M>::value) {
            return std::make_shared<detail::GenericAccessor<T, M>>(member);
        } else if constexpr (detail::has_describe<M>::value) {
            fd.layout = [] { return layout_of<M>(); };
            return std::make_shared<detail::NestedAccessor<T, M>>(member);
        } else {
            return nullptr;
        }
    }

    RecordDecl decl_;
};

template <typename T>
LayoutPtr layout_of() {
    static_assert(detail::has_describe<T>::value,
                  "record types need static void describe(codec::RecordSchema<T>&)");
    return LayoutCache::instance().get_or_build(std::type_index(typeid(T)), typeid(T).name(), [] {
        RecordSchema<T> schema;
        T::describe(schema);
        return LayoutBuilder::build(schema.decl());
    });
}

} // namespace codec
