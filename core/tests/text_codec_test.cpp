#include <array>
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "constant_time.h"
#include "hex_utils.h"
#include "secure_buffer.h"
#include "text_codec.h"

using idtok::common::Base64Decode;
using idtok::common::Base64Encode;
using idtok::common::BytesToHex;
using idtok::common::HexToBytes;
using idtok::common::IsLowerHex;
using idtok::common::IsValidUtf8;

namespace {

std::string Encode(const std::string& text) {
  return Base64Encode(reinterpret_cast<const std::uint8_t*>(text.data()),
                      text.size());
}

bool Decodes(const std::string& text, std::string& out) {
  std::vector<std::uint8_t> bytes;
  std::string err;
  if (!Base64Decode(text, bytes, err)) {
    assert(!err.empty());
    return false;
  }
  out.assign(bytes.begin(), bytes.end());
  return true;
}

}  // namespace

int main() {
  assert(Encode("") == "");
  assert(Encode("f") == "Zg==");
  assert(Encode("fo") == "Zm8=");
  assert(Encode("foo") == "Zm9v");
  assert(Encode("foobar") == "Zm9vYmFy");
  assert(Encode("ih") == "aWg=");

  std::string decoded;
  bool ok = Decodes("Zm9vYmE=", decoded);
  assert(ok);
  assert(decoded == "fooba");
  ok = Decodes("Zg==", decoded);
  assert(ok);
  assert(decoded == "f");
  ok = Decodes("", decoded);
  assert(ok);
  assert(decoded.empty());
  ok = Decodes("TEQySUtkdlZFOUw5ZzNhR080OHNWWEk3", decoded);
  assert(ok);
  assert(decoded == "LD2IKdvVE9L9g3aGO48sVXI7");

  assert(!Decodes("Zg", decoded));
  assert(!Decodes("Zg=", decoded));
  assert(!Decodes("Zm9v YmFy", decoded));
  assert(!Decodes("Zm9v\nYmFy", decoded));
  assert(!Decodes("Zm9*", decoded));
  assert(!Decodes("Z===", decoded));
  assert(!Decodes("Zg==Zg==", decoded));
  assert(!Decodes("Z=g=", decoded));

  assert(IsValidUtf8(std::string("plain ascii")));
  assert(IsValidUtf8(std::string("caf\xC3\xA9")));
  assert(IsValidUtf8(std::string("\xE2\x82\xAC")));
  assert(IsValidUtf8(std::string("\xF0\x9F\x98\x80")));
  assert(!IsValidUtf8(std::string("\xC3")));
  assert(!IsValidUtf8(std::string("\xC0\xAF")));
  assert(!IsValidUtf8(std::string("\xE0\x80\xAF")));
  assert(!IsValidUtf8(std::string("\xED\xA0\x80")));
  assert(!IsValidUtf8(std::string("\xF4\x90\x80\x80")));
  assert(!IsValidUtf8(std::string("\xFF")));
  assert(!IsValidUtf8(std::string("\x80")));

  const std::vector<std::uint8_t> raw = {0x00, 0x0f, 0xa5, 0xff};
  assert(BytesToHex(raw) == "000fa5ff");
  std::vector<std::uint8_t> parsed;
  ok = HexToBytes(std::string("000FA5ff"), parsed);
  assert(ok);
  assert(parsed == raw);
  assert(!HexToBytes(std::string("abc"), parsed));
  assert(!HexToBytes(std::string(""), parsed));
  assert(!HexToBytes(std::string("zz"), parsed));
  assert(IsLowerHex("00ff"));
  assert(!IsLowerHex("00FF"));
  assert(!IsLowerHex(""));
  assert(!IsLowerHex("0g"));

  const std::string abc = "abc";
  assert(idtok::common::Sha256Hex(
             reinterpret_cast<const std::uint8_t*>(abc.data()), abc.size()) ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  assert(idtok::common::ConstantTimeEqual(std::string_view("same"),
                                          std::string_view("same")));
  assert(!idtok::common::ConstantTimeEqual(std::string_view("same"),
                                           std::string_view("samf")));
  assert(!idtok::common::ConstantTimeEqual(std::string_view("same"),
                                           std::string_view("sam")));

  std::string secret = "wipe me";
  {
    idtok::common::ScopedWipe wipe(secret);
  }
  for (const char ch : secret) {
    assert(ch == '\0');
  }
  std::array<std::uint8_t, 4> key = {1, 2, 3, 4};
  idtok::common::SecureWipe(key);
  assert(key == (std::array<std::uint8_t, 4>{}));
  return 0;
}
