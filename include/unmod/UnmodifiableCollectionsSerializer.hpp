/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef UNMOD_UNMODIFIABLE_COLLECTIONS_SERIALIZER_HPP
#define UNMOD_UNMODIFIABLE_COLLECTIONS_SERIALIZER_HPP

#include <unmod/ForwardDcl.hpp>
#include <unmod/CodecErrors.hpp>
#include <unmod/Engine.hpp>
#include <unmod/Object.hpp>
#include <unmod/Serializer.hpp>
#include <unmod/Unmodifiable.hpp>

#include <array>
#include <cstdint>
#include <typeindex>

namespace unmod {

/**
 * @brief Read-only wrapper variants. The numeric value of each
 * variant is its tag on the wire: new variants must be appended
 * and existing ones must never be reordered.
 */
enum class WrapperVariant : int32_t {
    Collection       = 0,
    RandomAccessList = 1,
    List             = 2,
    Set              = 3,
    SortedSet        = 4,
    Map              = 5,
    SortedMap        = 6
};

/**
 * @brief Which member of a wrapper holds its delegate.
 */
enum class DelegateField {
    Collection, /* CollectionWrapper::delegate() */
    Map         /* MapWrapper::delegate() */
};

struct VariantInfo {

    using DelegateAccessor = const Object& (*)(const Object&);

    WrapperVariant   variant;
    std::type_index  type;
    DelegateField    field;
    DelegateAccessor delegate;
    const char*      name;

    int32_t tag() const {
        return static_cast<int32_t>(variant);
    }
};

/**
 * @brief The UnmodifiableCollectionsSerializer handles the read-only
 * wrappers declared in Unmodifiable.hpp. It writes a varint tag
 * identifying the wrapper's variant, then the wrapper's delegate
 * along with its class id. Reading rebuilds a wrapper of the same
 * variant around the deserialized delegate.
 *
 * Use Register(engine) to bind a new instance to all the wrapper types.
 */
class UnmodifiableCollectionsSerializer : public Serializer {

    public:

    static constexpr std::size_t NumVariants = 7;

    /**
     * @param engine Engine used to (de)serialize delegates.
     */
    explicit UnmodifiableCollectionsSerializer(const Engine& engine)
    : m_engine(engine) {}

    /**
     * @brief Write the wrapper's tag and delegate.
     * Throws an unmod::UnsupportedVariant if the object's type is
     * not exactly one of the wrapper types, and an
     * unmod::DelegateAccessFailure if its delegate cannot be obtained.
     */
    void write(Archive& archive, const Object& object) const override;

    /**
     * @brief Read a tag and a delegate and rebuild the wrapper.
     * Throws an unmod::InvalidTag if the tag is out of range.
     * The type argument is not used to select the variant.
     */
    Object read(Archive& archive, std::type_index type) const override;

    nlohmann::json metadata() const override;

    /**
     * @brief Creates a new UnmodifiableCollectionsSerializer and registers
     * it in the Engine as the Serializer for every wrapper type.
     * Calling it again on the same Engine replaces the Serializer
     * without changing the class ids.
     *
     * @param engine Engine in which to register the serializer.
     */
    static void Register(Engine& engine);

    /**
     * @brief Variant table, indexed by tag.
     */
    static const std::array<VariantInfo, NumVariants>& Variants();

    /**
     * @brief Variant whose wrapper type is exactly the given type.
     * Throws an unmod::UnsupportedVariant if there is none.
     */
    static const VariantInfo& VariantOf(std::type_index type);

    /**
     * @brief Variant corresponding to a tag.
     * Throws an unmod::InvalidTag if the tag is out of range.
     */
    static const VariantInfo& VariantFromTag(int32_t tag);

    /**
     * @brief Build the wrapper of the given variant around a delegate.
     */
    static Object Create(WrapperVariant variant, Object delegate);

    private:

    const Engine& m_engine;
};

}

#endif
