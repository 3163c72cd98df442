#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace codex
{

  inline void put_be64(std::string &s, uint64_t x)
  {
    for (int i = 7; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }
  inline void put_be32(std::string &s, uint32_t x)
  {
    for (int i = 3; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }

  inline uint64_t read_be64(const unsigned char *p)
  {
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i)
      x = (x << 8) | p[i];
    return x;
  }
  inline uint32_t read_be32(const unsigned char *p)
  {
    uint32_t x = 0;
    for (int i = 0; i < 4; ++i)
      x = (x << 8) | p[i];
    return x;
  }

  // length-prefixed string: <u32 len>|<bytes>
  inline void put_str(std::string &s, std::string_view v)
  {
    put_be32(s, static_cast<uint32_t>(v.size()));
    s.append(v);
  }

  // ids and type ids never contain NUL (enforced by validate), so NUL is the separator

  // nodes: <id>
  inline std::string key_node(std::string_view id)
  {
    return std::string(id);
  }

  // typeIndex: <typeId>\0<id>
  inline std::string key_type_index(std::string_view typeId, std::string_view id)
  {
    std::string k;
    k.reserve(typeId.size() + 1 + id.size());
    k.append(typeId);
    k.push_back('\0');
    k.append(id);
    return k;
  }
  inline std::string key_type_prefix(std::string_view typeId)
  {
    return key_type_index(typeId, {});
  }

  // stateIndex: <u8 state>|<id>
  inline std::string key_state_index(uint8_t state, std::string_view id)
  {
    std::string k;
    k.reserve(1 + id.size());
    k.push_back(char(state));
    k.append(id);
    return k;
  }

  // edgesBySrc: <from>\0<role>\0<to>   edgesByDst: <to>\0<role>\0<from>
  inline std::string key_edge(std::string_view major, std::string_view role, std::string_view minor)
  {
    std::string k;
    k.reserve(major.size() + role.size() + minor.size() + 2);
    k.append(major);
    k.push_back('\0');
    k.append(role);
    k.push_back('\0');
    k.append(minor);
    return k;
  }
  inline std::string key_edge_prefix(std::string_view major)
  {
    std::string k(major);
    k.push_back('\0');
    return k;
  }

  inline bool has_prefix(std::string_view key, std::string_view prefix)
  {
    return key.size() >= prefix.size() && key.compare(0, prefix.size(), prefix) == 0;
  }

  // meta bucket string keys
  inline std::string key_meta_schema_version() { return std::string("schemaVersion"); }
  inline std::string key_meta_tier() { return std::string("tier"); }

} // namespace codex
