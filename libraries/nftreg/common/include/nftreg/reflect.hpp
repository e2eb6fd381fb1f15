#pragma once

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>

/// Declares the serialized fields of a record, in order.
///
/// ```c++
/// struct Record { std::string name; std::uint64_t count; };
/// NFTREG_REFLECT(Record, (name)(count))
/// ```
///
/// Generates `forEachField(obj, f)`, which calls `f("name", obj.name)`
/// for each field. Serializers find it through argument-dependent lookup,
/// so the macro must be used in the namespace of the record.
#define NFTREG_REFLECT(TYPE, MEMBERS)                                        \
   template <typename F>                                                    \
   inline void forEachField(TYPE& obj, F&& f)                               \
   {                                                                        \
      BOOST_PP_SEQ_FOR_EACH(NFTREG_REFLECT_FIELD, _, MEMBERS)               \
   }                                                                        \
   template <typename F>                                                    \
   inline void forEachField(const TYPE& obj, F&& f)                         \
   {                                                                        \
      BOOST_PP_SEQ_FOR_EACH(NFTREG_REFLECT_FIELD, _, MEMBERS)               \
   }                                                                        \
   inline constexpr bool nftregReflected(const TYPE*)                       \
   {                                                                        \
      return true;                                                          \
   }

#define NFTREG_REFLECT_FIELD(r, data, member) f(BOOST_PP_STRINGIZE(member), obj.member);

namespace nftreg
{
   template <typename T>
   concept Reflected = requires(const T* p) { nftregReflected(p); };
}  // namespace nftreg
