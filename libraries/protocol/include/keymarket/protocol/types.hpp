/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <memory>
#include <vector>
#include <map>
#include <set>
#include <cstdint>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/cat.hpp>

#include <fc/io/varint.hpp>
#include <fc/io/enum_type.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/crypto/elliptic.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/container/flat.hpp>
#include <fc/string.hpp>
#include <fc/static_variant.hpp>

#include <keymarket/db/object_id.hpp>
#include <keymarket/protocol/config.hpp>

#define KEYMARKET_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define KEYMARKET_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define KEYMARKET_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            KEYMARKET_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define KEYMARKET_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(keymarket::id_namespace::name)

#define KEYMARKET_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace keymarket { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(KEYMARKET_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(KEYMARKET_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(keymarket::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(KEYMARKET_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(KEYMARKET_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(KEYMARKET_NAME_TO_ID_TYPE, , names_seq))

namespace keymarket { namespace protocol {
using namespace keymarket::db;

using std::map;
using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;
using std::set;
using std::pair;
using std::make_pair;

using fc::variant_object;
using fc::variant;
using fc::enum_type;
using fc::optional;
using fc::unsigned_int;
using fc::safe;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;
struct void_t{};

using private_key_type = fc::ecc::private_key;

enum reserved_spaces {
    relative_protocol_ids = 0,
    protocol_ids          = 1,
    implementation_ids    = 2
};

using share_type = safe<int64_t>;

/** Language code (two characters) to text */
using localized_text = flat_map<string, string>;

} }  // keymarket::protocol

/// Object types in the Protocol Space (enum object_type (1.x.x))
KEYMARKET_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                     /* 1.0.x  */ (null) // no data
                     /* 1.1.x  */ (base) // no data
                     /* 1.2.x  */ (game)
                     /* 1.3.x  */ (license)
                     /* 1.4.x  */ (license_key)
                     /* 1.5.x  */ (resale_listing)
                     /* 1.6.x  */ (capability)
                    )

FC_REFLECT_TYPENAME(keymarket::protocol::share_type)
FC_REFLECT(keymarket::protocol::void_t,)
