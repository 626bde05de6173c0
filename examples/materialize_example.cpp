// ═══════════════════════════════════════════════════════════════════
//  materialize_example.cpp — Cabin/Door schema to N-Triples and Turtle
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/s2dm.h"
#include <iostream>

using namespace s2dm;

int main() {
    auto model = sdl::parseSchema(R"(
        type Query { cabin: Cabin }

        "A vehicle cabin"
        type Cabin {
            kind: CabinKindEnum
            doors: [Door]
        }

        enum CabinKindEnum { SUV VAN }

        type Door {
            isOpen: Boolean!
            window: Window
        }

        type Window { isTinted: Boolean }
    )");

    auto config = MaterializerConfig::from("https://covesa.org/s2dm/mydomain#");
    auto result = rdf::Materializer(config).materialize(model);

    console::log("── N-Triples ──");
    std::cout << rdf::serializeNTriples(result.triples);
    console::log("── Turtle ──");
    std::cout << rdf::serializeTurtle(result.triples, result.config);
}
