#pragma once

// MarrowCore - denormalized relational records on SQLite
//
// Usage:
//   #include <MarrowCore.hpp>
//
//   marrow::schema_registry registry;
//   auto tag = registry.register_skeleton("tag");
//   tag->add<marrow::string_bone>("name");
//
//   auto item = registry.register_skeleton("item");
//   marrow::relational_options rel;
//   rel.kind = "tag";
//   rel.consistency = marrow::relational_consistency::prevent_deletion;
//   item->add<marrow::string_bone>("name");
//   item->add<marrow::relational_bone>("tag", rel);
//   registry.seal();
//
//   marrow::marrow_db db(registry);   // in-memory, or configuration("path.db")
//   auto red = db.create("tag");
//   red.set_bone_value("name", "red");
//   auto red_key = red.write();
//
//   auto shirt = db.create("item");
//   shirt.set_bone_value("name", "shirt");
//   shirt.set_bone_value("tag", red_key->to_string());
//   shirt.write();                     // caches tag.dest.name, locks red
//
//   db.drain_tasks();                  // run the background propagation

#include "marrow/types.hpp"
#include "marrow/hashing.hpp"
#include "marrow/layout.hpp"
#include "marrow/errors.hpp"
#include "marrow/log.hpp"
#include "marrow/config.hpp"
#include "marrow/db.hpp"
#include "marrow/entity_store.hpp"
#include "marrow/integrity.hpp"
#include "marrow/tasks.hpp"
#include "marrow/bone.hpp"
#include "marrow/bones.hpp"
#include "marrow/relational_bone.hpp"
#include "marrow/skeleton.hpp"
#include "marrow/skeleton_query.hpp"
#include "marrow/relations.hpp"
#include "marrow/marrow.hpp"
