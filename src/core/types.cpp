#include "mycelic/errors.hpp"
#include "mycelic/types.hpp"

#include <string>

namespace mycelic {

const char* ToString(AgentType type) {
  switch (type) {
    case AgentType::kDesktopAgent:
      return "desktop-agent";
    case AgentType::kCodeAgent:
      return "code-agent";
    case AgentType::kApiCaller:
      return "api-caller";
    case AgentType::kUnknown:
      return "unknown";
  }
  return "unknown";
}

const char* ToString(RelationshipType type) {
  switch (type) {
    case RelationshipType::kReferences:
      return "references";
    case RelationshipType::kContradicts:
      return "contradicts";
    case RelationshipType::kExpands:
      return "expands";
    case RelationshipType::kSimilar:
      return "similar";
    case RelationshipType::kSequential:
      return "sequential";
    case RelationshipType::kCauses:
      return "causes";
    case RelationshipType::kEnables:
      return "enables";
  }
  return "references";
}

AgentType ParseAgentType(const std::string& text) {
  for (const auto type : {AgentType::kDesktopAgent, AgentType::kCodeAgent, AgentType::kApiCaller, AgentType::kUnknown}) {
    if (text == ToString(type)) {
      return type;
    }
  }
  throw ConstraintError("unknown agent type: " + text);
}

RelationshipType ParseRelationshipType(const std::string& text) {
  for (const auto type : {RelationshipType::kReferences,
                          RelationshipType::kContradicts,
                          RelationshipType::kExpands,
                          RelationshipType::kSimilar,
                          RelationshipType::kSequential,
                          RelationshipType::kCauses,
                          RelationshipType::kEnables}) {
    if (text == ToString(type)) {
      return type;
    }
  }
  throw ConstraintError("unknown relationship type: " + text);
}

}  // namespace mycelic
