#pragma once

#include "search_cache/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace search_cache {

class ICodec {
public:
  virtual ~ICodec() = default;
  virtual CodecId id() const = 0;
  virtual std::string name() const = 0;
  virtual bool available() const = 0;
  virtual bool compress(const Bytes &in, Bytes *out,
                        std::string *err = nullptr) const = 0;
  virtual bool decompress(const Bytes &in, Bytes *out,
                          std::string *err = nullptr) const = 0;
};

struct CompressedPayload {
  CodecId codec{CodecId::None};
  Bytes data;
};

// Static priority chain, fastest first. Built once; the active codec is used
// for writes only, reads always go through the id stored with the payload.
class CodecRegistry {
public:
  explicit CodecRegistry(CodecId preferred = CodecId::ZlibFast);

  const ICodec &active() const { return *active_; }
  const ICodec *find(CodecId id) const;
  std::vector<CodecId> chain() const;

  std::optional<CompressedPayload> compress(const Bytes &raw,
                                            std::string *err = nullptr) const;
  bool decompress(CodecId id, const Bytes &data, Bytes *out,
                  std::string *err = nullptr) const;

private:
  std::vector<std::unique_ptr<ICodec>> codecs_;
  const ICodec *active_{nullptr};
};

std::unique_ptr<ICodec> make_codec(CodecId id);
std::optional<CodecId> codec_id_by_name(const std::string &name);
const char *codec_name(CodecId id);

} // namespace search_cache
