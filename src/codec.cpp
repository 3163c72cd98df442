#include "codec.hpp"
#include "encode.hpp"
#include "errors.hpp"
#include <cstring>

namespace codex
{

  namespace
  {

    constexpr uint8_t kRecordVersion = 1;

    enum class ValueTag : uint8_t
    {
      Null = 0,
      Bool = 1,
      I64 = 2,
      F64 = 3,
      Str = 4,
      StrList = 5
    };

    enum ContentFlags : uint8_t
    {
      HasJson = 1,
      HasBytes = 2,
      HasUri = 4
    };

    // bounds-checked cursor over a stored record
    struct Reader
    {
      const unsigned char *p;
      const unsigned char *end;

      void need(std::ptrdiff_t n, const char *what) const
      {
        if (end - p < n)
          throw StorageUnavailable(std::string("corrupt record: ") + what);
      }

      uint8_t u8(const char *what)
      {
        need(1, what);
        return *p++;
      }

      uint32_t u32(const char *what)
      {
        need(4, what);
        uint32_t x = read_be32(p);
        p += 4;
        return x;
      }

      uint64_t u64(const char *what)
      {
        need(8, what);
        uint64_t x = read_be64(p);
        p += 8;
        return x;
      }

      double f64(const char *what)
      {
        uint64_t ux = u64(what);
        double d;
        std::memcpy(&d, &ux, 8);
        return d;
      }

      std::string str(const char *what)
      {
        uint32_t len = u32(what);
        need(static_cast<std::ptrdiff_t>(len), what);
        std::string s(reinterpret_cast<const char *>(p), len);
        p += len;
        return s;
      }

      void finish(const char *what) const
      {
        if (p != end)
          throw StorageUnavailable(std::string("trailing data in ") + what);
      }
    };

    void put_f64(std::string &out, double d)
    {
      static_assert(sizeof(double) == 8, "double not 8 bytes");
      uint64_t ux;
      std::memcpy(&ux, &d, 8);
      put_be64(out, ux);
    }

    void encode_value(std::string &out, const MetaValue &v)
    {
      if (std::holds_alternative<bool>(v))
      {
        out.push_back(char(ValueTag::Bool));
        out.push_back(std::get<bool>(v) ? 1 : 0);
        return;
      }
      if (std::holds_alternative<int64_t>(v))
      {
        out.push_back(char(ValueTag::I64));
        put_be64(out, static_cast<uint64_t>(std::get<int64_t>(v)));
        return;
      }
      if (std::holds_alternative<double>(v))
      {
        out.push_back(char(ValueTag::F64));
        put_f64(out, std::get<double>(v));
        return;
      }
      if (std::holds_alternative<std::string>(v))
      {
        out.push_back(char(ValueTag::Str));
        put_str(out, std::get<std::string>(v));
        return;
      }
      if (std::holds_alternative<std::vector<std::string>>(v))
      {
        const auto &list = std::get<std::vector<std::string>>(v);
        out.push_back(char(ValueTag::StrList));
        put_be32(out, static_cast<uint32_t>(list.size()));
        for (const auto &s : list)
          put_str(out, s);
        return;
      }
      out.push_back(char(ValueTag::Null));
    }

    MetaValue decode_value(Reader &r)
    {
      auto tag = static_cast<ValueTag>(r.u8("value tag"));
      switch (tag)
      {
      case ValueTag::Null:
        return std::monostate{};
      case ValueTag::Bool:
        return bool(r.u8("bool") != 0);
      case ValueTag::I64:
        return static_cast<int64_t>(r.u64("i64"));
      case ValueTag::F64:
        return r.f64("f64");
      case ValueTag::Str:
        return r.str("string");
      case ValueTag::StrList:
      {
        uint32_t n = r.u32("list count");
        r.need(std::ptrdiff_t(n) * 4, "list items"); // every item carries a u32 length
        std::vector<std::string> list;
        list.reserve(n);
        for (uint32_t i = 0; i < n; ++i)
          list.push_back(r.str("list item"));
        return list;
      }
      }
      throw StorageUnavailable("unknown value tag");
    }

    void encode_meta(std::string &out, const Meta &m)
    {
      put_be32(out, static_cast<uint32_t>(m.size()));
      for (const auto &[k, v] : m)
      {
        put_str(out, k);
        encode_value(out, v);
      }
    }

    Meta decode_meta(Reader &r)
    {
      Meta m;
      uint32_t n = r.u32("meta count");
      for (uint32_t i = 0; i < n; ++i)
      {
        std::string k = r.str("meta key");
        m.emplace(std::move(k), decode_value(r));
      }
      return m;
    }

    Reader reader_for(std::string_view bytes)
    {
      const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
      return Reader{p, p + bytes.size()};
    }

  } // namespace

  std::string encodeNode(const Node &n)
  {
    std::string s;
    s.reserve(64 + n.id.size() + n.title.size() + n.description.size());
    s.push_back(char(kRecordVersion));
    put_str(s, n.id);
    put_str(s, n.typeId);
    s.push_back(char(n.state));
    put_str(s, n.locale);
    put_str(s, n.title);
    put_str(s, n.description);
    if (n.content)
    {
      const auto &c = *n.content;
      uint8_t flags = 0x80;
      if (c.inlineJson)
        flags |= HasJson;
      if (c.inlineBytes)
        flags |= HasBytes;
      if (c.externalUri)
        flags |= HasUri;
      s.push_back(char(flags));
      put_str(s, c.mediaType);
      if (c.inlineJson)
        put_str(s, *c.inlineJson);
      if (c.inlineBytes)
        put_str(s, *c.inlineBytes);
      if (c.externalUri)
        put_str(s, *c.externalUri);
    }
    else
    {
      s.push_back(0);
    }
    encode_meta(s, n.meta);
    return s;
  }

  Node decodeNode(std::string_view bytes)
  {
    Reader r = reader_for(bytes);
    if (r.u8("record version") != kRecordVersion)
      throw StorageUnavailable("unsupported node record version");
    Node n{};
    n.id = r.str("node id");
    n.typeId = r.str("node typeId");
    uint8_t state = r.u8("node state");
    if (state > static_cast<uint8_t>(NodeState::Gas))
      throw StorageUnavailable("corrupt node state");
    n.state = static_cast<NodeState>(state);
    n.locale = r.str("node locale");
    n.title = r.str("node title");
    n.description = r.str("node description");
    uint8_t flags = r.u8("content flags");
    if (flags & 0x80)
    {
      ContentRef c{};
      c.mediaType = r.str("content mediaType");
      if (flags & HasJson)
        c.inlineJson = r.str("content json");
      if (flags & HasBytes)
        c.inlineBytes = r.str("content bytes");
      if (flags & HasUri)
        c.externalUri = r.str("content uri");
      n.content = std::move(c);
    }
    n.meta = decode_meta(r);
    r.finish("node record");
    return n;
  }

  std::string encodeEdge(const Edge &e)
  {
    std::string s;
    s.reserve(32 + e.fromId.size() + e.toId.size() + e.role.size());
    s.push_back(char(kRecordVersion));
    put_str(s, e.fromId);
    put_str(s, e.toId);
    put_str(s, e.role);
    put_f64(s, e.weight);
    encode_meta(s, e.meta);
    return s;
  }

  Edge decodeEdge(std::string_view bytes)
  {
    Reader r = reader_for(bytes);
    if (r.u8("record version") != kRecordVersion)
      throw StorageUnavailable("unsupported edge record version");
    Edge e{};
    e.fromId = r.str("edge fromId");
    e.toId = r.str("edge toId");
    e.role = r.str("edge role");
    e.weight = r.f64("edge weight");
    e.meta = decode_meta(r);
    r.finish("edge record");
    return e;
  }

} // namespace codex
