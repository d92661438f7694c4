//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Types.hpp
/// @brief Semantic type representation for the Per language.
///
/// Per has five type forms: `i64`, `string`, fixed-size arrays `[T; N]`,
/// pointers `*T` and `void`.  Types are immutable and shared through TypeRef.
/// Equality is structural: two `[i64; 10]` types compare equal regardless of
/// where they were spelled.
///
/// ```
/// TypeRef a = types::array(types::i64(), 3);
/// TypeRef p = types::pointer(types::i64());
/// sameType(*a, *types::array(types::i64(), 3)); // true
/// ```
///
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace perc::frontends::per
{

enum class TypeKind
{
    I64,
    String,
    Array,
    Pointer,
    Void,
};

struct Type;

/// @brief Shared immutable type handle; never null for a resolved type.
using TypeRef = std::shared_ptr<const Type>;

struct Type
{
    TypeKind kind;

    /// @brief Element type for Array and Pointer; null otherwise.
    TypeRef elem;

    /// @brief Element count for Array; zero otherwise.
    int64_t length = 0;

    [[nodiscard]] bool isI64() const
    {
        return kind == TypeKind::I64;
    }

    [[nodiscard]] bool isVoid() const
    {
        return kind == TypeKind::Void;
    }

    [[nodiscard]] bool isArray() const
    {
        return kind == TypeKind::Array;
    }

    [[nodiscard]] bool isPointer() const
    {
        return kind == TypeKind::Pointer;
    }

    /// @brief True for the types that fit in one machine word.
    [[nodiscard]] bool isWord() const
    {
        return kind == TypeKind::I64 || kind == TypeKind::String || kind == TypeKind::Pointer;
    }
};

namespace types
{
TypeRef i64();
TypeRef string();
TypeRef voidType();
TypeRef array(TypeRef elem, int64_t length);
TypeRef pointer(TypeRef elem);
} // namespace types

/// @brief Structural type equality.
bool sameType(const Type &a, const Type &b);

/// @brief Render a type in source syntax, e.g. "[i64; 3]" or "*i64".
std::string typeToString(const Type &type);

/// @brief Number of 8-byte words a value of @p type occupies in a frame.
/// @return N for `[T; N]` of word-sized T, 1 for word types, 0 for void;
///         saturates at UINT64_MAX.
uint64_t frameWords(const Type &type);

} // namespace perc::frontends::per
