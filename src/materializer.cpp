// ═══════════════════════════════════════════════════════════════════
//  src/materializer.cpp — Schema-to-graph triple emission
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/materializer.h"
#include "s2dm/console.h"
#include "s2dm/type_wrapper.h"
#include "s2dm/vocab.h"

#include <algorithm>
#include <cctype>
#include <future>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace s2dm::rdf {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

// ── Emission context for a single type definition ──
class TypeEmitter {
public:
    TypeEmitter(const MaterializerConfig& config, const UriGenerator& uris)
        : config_(config), uris_(uris) {}

    std::vector<Triple> run(const TypeDefinition& def) {
        std::visit(Overloaded{
            [&](const ObjectTypeDefinition& t) {
                emitContainer(t.name, t.description, t.fields, "ObjectType");
            },
            [&](const InterfaceTypeDefinition& t) {
                emitContainer(t.name, t.description, t.fields, "InterfaceType");
            },
            [&](const InputObjectTypeDefinition& t) {
                emitContainer(t.name, t.description, t.fields, "InputObjectType");
            },
            [&](const UnionTypeDefinition& t) { emitUnion(t); },
            [&](const EnumTypeDefinition& t) { emitEnum(t); },
            [&](const ScalarTypeDefinition& t) { emitScalar(t); },
        }, def);
        return std::move(out_);
    }

private:
    const MaterializerConfig& config_;
    const UriGenerator& uris_;
    std::vector<Triple> out_;

    void add(const std::string& s, const std::string& p, Term o) {
        out_.push_back({s, p, std::move(o)});
    }

    void conceptHeader(const std::string& uri, const std::string& label,
                       const std::string& description, const char* s2dmType) {
        add(uri, vocab::rdfType(), Term::iri(vocab::skosConcept()));
        add(uri, vocab::rdfType(), Term::iri(vocab::s2dm(s2dmType)));
        add(uri, vocab::prefLabel(), Term::literal(label, config_.language));
        if (!isBlank(description)) {
            add(uri, vocab::definition(), Term::literal(description));
        }
    }

    void emitContainer(const std::string& name, const std::string& description,
                       const std::vector<FieldDefinition>& fields, const char* s2dmType) {
        auto typeUri = uris_.typeUri(name);
        conceptHeader(typeUri, name, description, s2dmType);

        for (auto& field : fields) {
            auto fieldUri = uris_.memberUri(name, field.name);
            auto wrapper = classifyField(field);
            auto path = name + "." + field.name;

            add(typeUri, vocab::hasField(), Term::iri(fieldUri));
            conceptHeader(fieldUri, path, "", "Field");
            add(fieldUri, vocab::hasOutputType(),
                Term::iri(uris_.outputTypeUri(wrapper.baseType, path)));
            add(fieldUri, vocab::usesTypeWrapperPattern(),
                Term::iri(vocab::s2dm(shapeTag(wrapper.shape))));
        }
    }

    void emitUnion(const UnionTypeDefinition& t) {
        auto unionUri = uris_.typeUri(t.name);
        conceptHeader(unionUri, t.name, t.description, "UnionType");
        for (auto& member : t.members) {
            add(unionUri, vocab::hasUnionMember(), Term::iri(uris_.typeUri(member, t.name)));
        }
    }

    void emitEnum(const EnumTypeDefinition& t) {
        auto enumUri = uris_.typeUri(t.name);
        conceptHeader(enumUri, t.name, t.description, "EnumType");
        for (auto& value : t.values) {
            auto valueUri = uris_.memberUri(t.name, value.name);
            add(enumUri, vocab::hasEnumValue(), Term::iri(valueUri));
            conceptHeader(valueUri, t.name + "." + value.name, "", "EnumValue");
        }
    }

    void emitScalar(const ScalarTypeDefinition& t) {
        // built-in scalars live in the s2dm vocabulary already
        if (isBuiltinScalar(t.name)) return;
        conceptHeader(uris_.typeUri(t.name), t.name, t.description, "ScalarType");
    }
};

template <typename Fields>
void checkFieldNames(const std::string& owner, const Fields& fields) {
    std::unordered_set<std::string> seen;
    for (auto& f : fields) {
        if (!seen.insert(f.name).second) {
            throw MaterializeError(ErrorKind::DuplicateDefinition, owner + "." + f.name,
                                   "field defined more than once");
        }
    }
}

} // namespace

Materializer::Materializer(MaterializerConfig config)
    : config_(std::move(config)), uris_(config_.namespaceIri) {
    config_.validate();
}

std::vector<Triple> Materializer::emitType(const TypeDefinition& def) const {
    return TypeEmitter(config_, uris_).run(def);
}

void Materializer::checkDefinitions(const SchemaModel& schema) const {
    std::unordered_set<std::string> typeNames;
    // concept URI -> qualified path that produced it
    std::unordered_map<std::string, std::string> concepts;

    auto claim = [&](const std::string& uri, const std::string& path) {
        auto [it, inserted] = concepts.emplace(uri, path);
        if (!inserted) {
            throw MaterializeError(ErrorKind::DuplicateDefinition, path,
                                   "resolves to the same URI as '" + it->second + "'");
        }
    };

    for (auto& def : schema.types()) {
        const auto& name = nameOf(def);
        if (!typeNames.insert(name).second) {
            throw MaterializeError(ErrorKind::DuplicateDefinition, name,
                                   "type defined more than once");
        }
        if (schema.isExcluded(name)) continue;

        if (isBuiltinScalar(name)) {
            if (kindOf(def) == TypeKind::Scalar) continue;
            throw MaterializeError(ErrorKind::DuplicateDefinition, name,
                                   "redefines a built-in scalar");
        }

        claim(uris_.typeUri(name), name);
        std::visit(Overloaded{
            [&](const UnionTypeDefinition&) {},
            [&](const ScalarTypeDefinition&) {},
            [&](const EnumTypeDefinition& e) {
                checkFieldNames(e.name, e.values);
                for (auto& v : e.values) claim(uris_.memberUri(e.name, v.name), v.qualifiedName());
            },
            [&](const auto& container) {
                checkFieldNames(container.name, container.fields);
                for (auto& f : container.fields) {
                    claim(uris_.memberUri(container.name, f.name), f.qualifiedName());
                }
            },
        }, def);
    }
}

void Materializer::checkRootReferences(const SchemaModel& schema) const {
    auto check = [&](const std::string& owner, const std::vector<FieldDefinition>& fields) {
        for (auto& f : fields) {
            const auto& target = f.type.name;
            if (!schema.isExcluded(target)) continue;

            auto path = owner + "." + f.name;
            if (schema.roots().contains(target) &&
                config_.rootReferencePolicy == RootReferencePolicy::Reject) {
                throw MaterializeError(ErrorKind::RootTypeReference, path,
                                       "output type '" + target + "' is a root operation type");
            }
            console::warn("Field", path, "references excluded type", target,
                          "; emitting the reference only");
        }
    };

    for (auto& def : schema.types()) {
        if (schema.isExcluded(nameOf(def))) continue;
        std::visit(Overloaded{
            [&](const ObjectTypeDefinition& t) { check(t.name, t.fields); },
            [&](const InterfaceTypeDefinition& t) { check(t.name, t.fields); },
            [&](const InputObjectTypeDefinition& t) { check(t.name, t.fields); },
            [](const auto&) {},
        }, def);
    }
}

std::vector<Triple> Materializer::emitAll(const std::vector<const TypeDefinition*>& retained) const {
    std::size_t workers = config_.parallel ? std::max(1u, std::thread::hardware_concurrency()) : 1;
    workers = std::min(workers, retained.size());

    if (workers <= 1) {
        std::vector<Triple> all;
        for (auto* def : retained) {
            auto triples = emitType(*def);
            all.insert(all.end(), std::make_move_iterator(triples.begin()),
                       std::make_move_iterator(triples.end()));
        }
        return all;
    }

    // Contiguous chunks; config and URI generator are shared read-only
    std::vector<std::future<std::vector<Triple>>> futures;
    std::size_t chunk = (retained.size() + workers - 1) / workers;
    for (std::size_t begin = 0; begin < retained.size(); begin += chunk) {
        std::size_t end = std::min(begin + chunk, retained.size());
        futures.push_back(std::async(std::launch::async, [this, &retained, begin, end]() {
            std::vector<Triple> part;
            for (std::size_t i = begin; i < end; ++i) {
                auto triples = emitType(*retained[i]);
                part.insert(part.end(), std::make_move_iterator(triples.begin()),
                            std::make_move_iterator(triples.end()));
            }
            return part;
        }));
    }

    // Merge point. get() rethrows the first worker failure; the remaining
    // futures block in their destructors, so no worker outlives this call.
    std::vector<Triple> all;
    for (auto& f : futures) {
        auto part = f.get();
        all.insert(all.end(), std::make_move_iterator(part.begin()),
                   std::make_move_iterator(part.end()));
    }
    return all;
}

MaterializeResult Materializer::materialize(const SchemaModel& schema) const {
    checkDefinitions(schema);
    checkRootReferences(schema);

    std::vector<const TypeDefinition*> retained;
    for (auto& def : schema.types()) {
        const auto& name = nameOf(def);
        if (schema.isExcluded(name)) {
            console::debug("Skipping excluded type", name);
            continue;
        }
        if (kindOf(def) == TypeKind::Scalar && isBuiltinScalar(name)) continue;
        console::debug("Materializing", kindName(kindOf(def)), name);
        retained.push_back(&def);
    }

    MaterializeResult result;
    result.config = config_;
    result.retainedTypes = retained.size();
    result.triples.append(emitAll(retained));

    if (directiveHandler_) {
        SchemaModel retainedModel;
        retainedModel.roots() = schema.roots();
        for (auto* def : retained) retainedModel.add(*def);
        result.triples.append(directiveHandler_(retainedModel, config_));
    }

    if (retained.empty()) {
        result.emptySchema = true;
        console::warn("Schema has no type definitions after excluding root operation and "
                      "introspection types; artifacts will be empty");
    } else {
        console::info("Materialized", result.retainedTypes, "types into",
                      result.triples.size(), "triples");
    }
    return result;
}

MaterializeResult materializeSchema(const SchemaModel& schema, const MaterializerConfig& config) {
    return Materializer(config).materialize(schema);
}

} // namespace s2dm::rdf
