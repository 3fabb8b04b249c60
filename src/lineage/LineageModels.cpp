#include "lineage/LineageModels.h"

std::string toString(AnalysisLevel level) {
  switch (level) {
  case AnalysisLevel::COLUMN:
    return "column";
  case AnalysisLevel::TABLE:
    return "table";
  }
  return "column";
}

std::string toString(TableUsage usage) {
  switch (usage) {
  case TableUsage::INPUT:
    return "INPUT";
  case TableUsage::OUTPUT:
    return "OUTPUT";
  case TableUsage::BOTH:
    return "BOTH";
  }
  return "INPUT";
}

std::string toString(ObjectType type) {
  switch (type) {
  case ObjectType::TABLE:
    return "TABLE";
  case ObjectType::VIEW:
    return "VIEW";
  case ObjectType::CTE:
    return "CTE";
  case ObjectType::UNKNOWN:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}
