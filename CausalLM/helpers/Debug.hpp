#pragma once
#include <QDebug>

#include <CausalLM/helpers/Graph.hpp>
#include <CausalLM/helpers/IOSchema.hpp>

inline QDebug operator<<(QDebug s, CausalLM::ElementType t)
{
  using CausalLM::ElementType;
  switch (t)
  {
    case ElementType::Float32:
      return s << "FLOAT";
    case ElementType::Float16:
      return s << "FLOAT16";
    case ElementType::Int64:
      return s << "INT64";
    case ElementType::Int32:
      return s << "INT32";
    case ElementType::Other:
      return s << "OTHER";
  }
  return s;
}

inline QDebug operator<<(QDebug s, CausalLM::IOPreset p)
{
  using CausalLM::IOPreset;
  switch (p)
  {
    case IOPreset::Auto:
      return s << "auto";
    case IOPreset::SimpleCausal:
      return s << "simple-causal";
    case IOPreset::KVCacheStyle:
      return s << "kv-cache";
  }
  return s;
}

inline QDebug operator<<(QDebug s, const CausalLM::SlotInfo& slot)
{
  QDebugStateSaver saver(s);
  s.nospace() << slot.name.c_str() << " " << slot.elementType << " "
              << slot.shape;
  return s;
}

inline QDebug operator<<(QDebug s, const CausalLM::IOSchema& schema)
{
  s << "IOSchema: " << schema.inputNames.size() << "inputs,"
    << schema.outputNames.size() << "outputs\n";
  for (auto& name : schema.inputNames)
  {
    s << " - i: " << name.c_str();
    if (auto slot = schema.findInput(name))
      s << "=>" << slot->elementType << slot->shape;
    s << "\n";
  }
  for (auto& name : schema.outputNames)
    s << " - o: " << name.c_str() << "\n";
  return s;
}
