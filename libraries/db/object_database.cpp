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
#include <keymarket/db/object_database.hpp>

namespace keymarket { namespace db {

object_database::object_database()
:_undo_db(*this)
{
   _index.resize(_index_size);
   _undo_db.enable();
}

void object_database::close()
{
   _undo_db.disable();
   for( auto& space : _index )
   {
      for( auto& idx : space )
      {
         if( !idx )
            continue;
         std::vector<object_id_type> ids;
         ids.reserve( idx->size() );
         idx->inspect_all_objects( [&ids]( const object& obj ) { ids.push_back( obj.id ); } );
         for( const auto& id : ids )
            idx->modify( idx->get( id ), []( object& obj ) { obj.clear(); } );
      }
   }
}

const object* object_database::find_object( const object_id_type& id )const
{
   return get_index(id.space(),id.type()).find( id );
}
const object& object_database::get_object( const object_id_type& id )const
{
   return get_index(id.space(),id.type()).get( id );
}

const index& object_database::get_index(uint8_t space_id, uint8_t type_id)const
{
   FC_ASSERT( _index.size() > space_id,
              "Database index ${space_id}.${type_id} does not exist, index size is ${index.size}",
              ("space_id",space_id)("type_id",type_id)("index.size",_index.size()) );
   FC_ASSERT( _index[space_id].size() > type_id,
              "Database index ${space_id}.${type_id} does not exist, space size is ${index[space_id].size}",
              ("space_id",space_id)("type_id",type_id)("index[space_id].size",_index[space_id].size()) );
   const auto& tmp = _index[space_id][type_id]; // it is a unique_ptr
   FC_ASSERT( tmp != nullptr,
              "Database index ${space_id}.${type_id} has not been initialized",
              ("space_id",space_id)("type_id",type_id) );
   return *tmp;
}
index& object_database::get_mutable_index(uint8_t space_id, uint8_t type_id)
{
   FC_ASSERT( _index.size() > space_id,
              "Database index ${space_id}.${type_id} does not exist, index size is ${index.size}",
              ("space_id",space_id)("type_id",type_id)("index.size",_index.size()) );
   FC_ASSERT( _index[space_id].size() > type_id ,
              "Database index ${space_id}.${type_id} does not exist, space size is ${index[space_id].size}",
              ("space_id",space_id)("type_id",type_id)("index[space_id].size",_index[space_id].size()) );
   const auto& idx = _index[space_id][type_id]; // it is a unique_ptr
   FC_ASSERT( idx != nullptr,
              "Database index ${space_id}.${type_id} has not been initialized",
              ("space_id",space_id)("type_id",type_id) );
   return *idx;
}

void object_database::save_undo( const object& obj )
{
   _undo_db.on_modify( obj );
}

void object_database::save_undo_add( const object& obj )
{
   _undo_db.on_create( obj );
}

void object_database::save_undo_insert( const object& obj )
{
   _undo_db.on_insert( obj );
}

void object_database::save_undo_remove(const object& obj)
{
   _undo_db.on_remove( obj );
}

void base_primary_index::save_undo( const object& obj )
{ _db.save_undo( obj ); }

void base_primary_index::on_create( const object& obj )
{ _db.save_undo_add( obj ); }

void base_primary_index::on_insert( const object& obj )
{ _db.save_undo_insert( obj ); }

void base_primary_index::on_remove( const object& obj )
{ _db.save_undo_remove( obj ); }

} } // keymarket::db
