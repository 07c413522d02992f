/*
 * (C) 2023 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "unmod/UnmodifiableCollectionsSerializer.hpp"
#include "unmod/CodecErrors.hpp"
#include "unmod/Primitives.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace unmod {

template<typename W>
static const Object& delegateOf(const Object& wrapper) {
    auto w = wrapper.tryAs<W>();
    if(!w)
        throw DelegateAccessFailure{fmt::format(
            "Could not access the delegate of an object of type {}",
            wrapper.type().name())};
    if(!w->delegate())
        throw DelegateAccessFailure{fmt::format(
            "Object of type {} has a null delegate", wrapper.type().name())};
    return w->delegate();
}

template<typename W>
static VariantInfo makeVariant(WrapperVariant variant, DelegateField field, const char* name) {
    return VariantInfo{variant, std::type_index{typeid(W)}, field, &delegateOf<W>, name};
}

const std::array<VariantInfo, UnmodifiableCollectionsSerializer::NumVariants>&
UnmodifiableCollectionsSerializer::Variants() {
    static const std::array<VariantInfo, NumVariants> variants = {
        makeVariant<UnmodifiableCollection>(
            WrapperVariant::Collection, DelegateField::Collection, "UnmodifiableCollection"),
        makeVariant<UnmodifiableRandomAccessList>(
            WrapperVariant::RandomAccessList, DelegateField::Collection, "UnmodifiableRandomAccessList"),
        makeVariant<UnmodifiableList>(
            WrapperVariant::List, DelegateField::Collection, "UnmodifiableList"),
        makeVariant<UnmodifiableSet>(
            WrapperVariant::Set, DelegateField::Collection, "UnmodifiableSet"),
        makeVariant<UnmodifiableSortedSet>(
            WrapperVariant::SortedSet, DelegateField::Collection, "UnmodifiableSortedSet"),
        makeVariant<UnmodifiableMap>(
            WrapperVariant::Map, DelegateField::Map, "UnmodifiableMap"),
        makeVariant<UnmodifiableSortedMap>(
            WrapperVariant::SortedMap, DelegateField::Map, "UnmodifiableSortedMap")
    };
    return variants;
}

const VariantInfo& UnmodifiableCollectionsSerializer::VariantOf(std::type_index type) {
    for(const auto& info : Variants()) {
        if(info.type == type) return info;
    }
    throw UnsupportedVariant{fmt::format("The type {} is not supported", type.name())};
}

const VariantInfo& UnmodifiableCollectionsSerializer::VariantFromTag(int32_t tag) {
    if(tag < 0 || static_cast<std::size_t>(tag) >= NumVariants)
        throw InvalidTag{fmt::format(
            "Invalid read-only wrapper tag {} (expected 0 to {})", tag, NumVariants - 1)};
    return Variants()[static_cast<std::size_t>(tag)];
}

Object UnmodifiableCollectionsSerializer::Create(WrapperVariant variant, Object delegate) {
    switch(variant) {
        case WrapperVariant::Collection:
            return Object::Make<UnmodifiableCollection>(std::move(delegate));
        case WrapperVariant::RandomAccessList:
            return Object::Make<UnmodifiableRandomAccessList>(std::move(delegate));
        case WrapperVariant::List:
            return Object::Make<UnmodifiableList>(std::move(delegate));
        case WrapperVariant::Set:
            return Object::Make<UnmodifiableSet>(std::move(delegate));
        case WrapperVariant::SortedSet:
            return Object::Make<UnmodifiableSortedSet>(std::move(delegate));
        case WrapperVariant::Map:
            return Object::Make<UnmodifiableMap>(std::move(delegate));
        case WrapperVariant::SortedMap:
            return Object::Make<UnmodifiableSortedMap>(std::move(delegate));
    }
    throw InvalidTag{fmt::format(
        "Invalid read-only wrapper variant {}", static_cast<int32_t>(variant))};
}

void UnmodifiableCollectionsSerializer::write(Archive& archive, const Object& object) const {
    const auto& info = VariantOf(object.type());
    const auto& delegate = info.delegate(object);
    spdlog::trace("[unmod] Writing {} (tag={})", info.name, info.tag());
    writeVarInt(archive, info.tag(), true);
    m_engine.writeClassAndObject(archive, delegate);
}

Object UnmodifiableCollectionsSerializer::read(Archive& archive, std::type_index type) const {
    const auto& info = VariantFromTag(readVarInt(archive, true));
    if(info.type != type)
        spdlog::trace("[unmod] Reading {} where {} was expected", info.name, type.name());
    auto delegate = m_engine.readClassAndObject(archive);
    spdlog::trace("[unmod] Read {} (tag={})", info.name, info.tag());
    return Create(info.variant, std::move(delegate));
}

nlohmann::json UnmodifiableCollectionsSerializer::metadata() const {
    return nlohmann::json{{"type", "unmodifiable_collections"}};
}

static Object emptyDelegate(WrapperVariant variant) {
    switch(variant) {
        case WrapperVariant::List:      return Object::Make<LinkedList>();
        case WrapperVariant::Set:       return Object::Make<HashSet>();
        case WrapperVariant::SortedSet: return Object::Make<TreeSet>();
        case WrapperVariant::Map:       return Object::Make<HashMap>();
        case WrapperVariant::SortedMap: return Object::Make<TreeMap>();
        default:                        return Object::Make<ArrayList>();
    }
}

void UnmodifiableCollectionsSerializer::Register(Engine& engine) {
    auto serializer = std::make_shared<UnmodifiableCollectionsSerializer>(engine);
    for(const auto& info : Variants()) {
        // check that the delegate accessor works before accepting any call
        auto probe = Create(info.variant, emptyDelegate(info.variant));
        if(probe.type() != info.type)
            throw DelegateAccessFailure{fmt::format(
                "Variant {} does not create objects of its own type", info.name)};
        info.delegate(probe);
        engine.registerClass(info.type, info.name, serializer);
    }
}

}
