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
#include <keymarket/db/object_id.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/variant.hpp>

#include <memory>

#define KEYMARKET_MAX_NESTED_OBJECTS (200)

namespace keymarket { namespace db {

   using std::unique_ptr;
   using fc::variant;

   /**
    *  @brief base for all database objects
    *
    *  The object is the fundamental building block of the database and
    *  is the level upon which undo operations are performed.  Objects
    *  are used to track data and their relationships and provide an efficient
    *  means to find and update information.
    *
    *  Objects are assigned a unique and sequential object ID by the database within
    *  the id_space defined in the object.
    *
    *  Objects that hold value (a stored_value member) can not be copied. Instead,
    *  each object knows how to save its own state into a backup object, how to
    *  restore itself from such a backup, and how to turn a backup back into a live
    *  object. The undo_database only ever uses these three methods.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object() = default;
         virtual ~object() = default;

         static constexpr uint8_t space_id = 0;
         static constexpr uint8_t type_id  = 0;

         // serialized
         object_id_type          id;

         /// Creates a snapshot of this object, suitable for restore() and recreate()
         virtual unique_ptr<object> backup()const = 0;
         /// Replaces the content of this object with a snapshot previously taken by backup()
         virtual void               restore( object& obj ) = 0;
         /// Called on a snapshot, creates a live object from it
         virtual unique_ptr<object> recreate() = 0;
         /// Drops held value without accounting; only used when undo throws the object away
         virtual void               clear() {}
         virtual variant            to_variant()const = 0;
   };

   /**
    * @class abstract_object
    * @brief   Use the Curiously Recurring Template Pattern to automatically add the ability to
    *  backup, restore and serialize objects polymorphically.
    *
    *  @tparam DerivedClass the copyable class that carries the object's plain state
    *  @tparam SerializedClass the class that is actually stored in the index; it differs from
    *  DerivedClass when the stored class adds non-copyable members such as stored_value
    *
    *  http://en.wikipedia.org/wiki/Curiously_recurring_template_pattern
    */
   template<typename DerivedClass, uint8_t SpaceID, uint8_t TypeID, typename SerializedClass = DerivedClass>
   class abstract_object : public object
   {
      public:
         static constexpr uint8_t space_id = SpaceID;
         static constexpr uint8_t type_id = TypeID;
         using id_type = object_id<SpaceID,TypeID>;

         id_type get_id()const { return id_type( id.instance() ); }

         virtual unique_ptr<object> backup()const override
         {
            return std::make_unique<DerivedClass>( static_cast<const DerivedClass&>(*this) );
         }
         virtual void restore( object& obj ) override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         virtual unique_ptr<object> recreate() override
         {
            return std::make_unique<DerivedClass>( std::move( static_cast<DerivedClass&>(*this) ) );
         }
         virtual variant to_variant()const override
         {
            return variant( static_cast<const SerializedClass&>(*this), KEYMARKET_MAX_NESTED_OBJECTS );
         }
   };

   /**
    *  Base for the snapshot classes of objects that hold value. A snapshot stores the plain
    *  state of the object plus the amounts of its stored_value members, and knows how to rebuild
    *  the live ObjectType from itself.
    */
   template<typename ObjectType>
   class backup_object
   {
      protected:
         unique_ptr<object> recreate_from( object& snapshot )
         {
            unique_ptr<object> result = std::make_unique<ObjectType>();
            result->restore( snapshot );
            return result;
         }
   };

} } // keymarket::db

FC_REFLECT( keymarket::db::object, (id) )
