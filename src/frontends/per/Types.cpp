//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Types.cpp
/// @brief Type singletons, structural equality and printing.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Types.hpp"

namespace perc::frontends::per
{

namespace types
{

TypeRef i64()
{
    static const TypeRef instance = std::make_shared<const Type>(Type{TypeKind::I64, nullptr, 0});
    return instance;
}

TypeRef string()
{
    static const TypeRef instance =
        std::make_shared<const Type>(Type{TypeKind::String, nullptr, 0});
    return instance;
}

TypeRef voidType()
{
    static const TypeRef instance = std::make_shared<const Type>(Type{TypeKind::Void, nullptr, 0});
    return instance;
}

TypeRef array(TypeRef elem, int64_t length)
{
    return std::make_shared<const Type>(Type{TypeKind::Array, std::move(elem), length});
}

TypeRef pointer(TypeRef elem)
{
    return std::make_shared<const Type>(Type{TypeKind::Pointer, std::move(elem), 0});
}

} // namespace types

bool sameType(const Type &a, const Type &b)
{
    if (&a == &b)
        return true;
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
        case TypeKind::I64:
        case TypeKind::String:
        case TypeKind::Void:
            return true;
        case TypeKind::Array:
            return a.length == b.length && sameType(*a.elem, *b.elem);
        case TypeKind::Pointer:
            return sameType(*a.elem, *b.elem);
    }
    return false;
}

std::string typeToString(const Type &type)
{
    switch (type.kind)
    {
        case TypeKind::I64:
            return "i64";
        case TypeKind::String:
            return "string";
        case TypeKind::Void:
            return "void";
        case TypeKind::Array:
            return "[" + typeToString(*type.elem) + "; " + std::to_string(type.length) + "]";
        case TypeKind::Pointer:
            return "*" + typeToString(*type.elem);
    }
    return "?";
}

uint64_t frameWords(const Type &type)
{
    switch (type.kind)
    {
        case TypeKind::Void:
            return 0;
        case TypeKind::Array:
        {
            const uint64_t elem = frameWords(*type.elem);
            const auto length = static_cast<uint64_t>(type.length);
            if (elem != 0 && length > UINT64_MAX / elem)
                return UINT64_MAX;
            return length * elem;
        }
        case TypeKind::I64:
        case TypeKind::String:
        case TypeKind::Pointer:
            return 1;
    }
    return 1;
}

} // namespace perc::frontends::per
