#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/s2dm.h — Umbrella header for the s2dm RDF materializer
// ═══════════════════════════════════════════════════════════════════
//
//  #include "s2dm/s2dm.h"
//  using namespace s2dm;
//
//  This single include gives you:
//    • SchemaModel and the six type definition kinds
//    • sdl::parseSchema(), sdl::loadSchema()
//    • classifyField(), rdf::UriGenerator
//    • rdf::Materializer, rdf::serializeNTriples(), serializeTurtle()
//    • rdf::writeArtifacts()
//    • MaterializerConfig, loadConfigFile()
//    • console::log(), info(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "errors.h"
#include "console.h"
#include "config.h"
#include "schema.h"

// Schema input
#include "sdl_parser.h"
#include "schema_json.h"
#include "schema_loader.h"

// Materialization
#include "type_wrapper.h"
#include "uri.h"
#include "vocab.h"
#include "triple.h"
#include "materializer.h"
#include "serializer.h"
#include "artifacts.h"
#include "cli.h"
