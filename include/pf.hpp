// pf.hpp - Pipefitter
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Pipefitter Core Principles:
//========================================================================
//
// The Neutral-Tree Principle
// --------------------------
// One tree shape carries every format. A JSON object, an XML element
// and a CSV row are all records; what differs is the meaning a format
// gives to each kind of node.
//
//
// The Rules-Are-Data Principle
// ----------------------------
// What a format means lives in its semantics record: kind -> role,
// role -> kind, one strategy per structural category, and the query
// primitives. Adding a format adds a record, not code paths.
//
//
// The Immutable-Input Principle
// -----------------------------
// Conversions and operations never touch their input. They build new
// nodes and share untouched subtrees.
//
//
// The Miss-Is-Not-An-Error Principle
// ----------------------------------
// Looking up a key or path that is not there yields nothing. Only
// asking for a format nobody registered is an error.
//
//========================================================================

#ifndef PF_PIPEFITTER_HPP
#define PF_PIPEFITTER_HPP

#include "pf_core.hpp"
#include "pf_log.hpp"
#include "pf_node.hpp"
#include "pf_semantics.hpp"
#include "pf_config.hpp"
#include "pf_registry.hpp"
#include "pf_message.hpp"
#include "pf_transform.hpp"
#include "pf_operations.hpp"
#include "pf_dump.hpp"

#endif
