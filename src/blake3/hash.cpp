#include <blake3.h>
#include <lockbox/blake3/hash.hpp>

namespace lockbox::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  void update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
  }

  lockbox::schema::hash32_t finalize() {
    auto output = lockbox::schema::hash32_t{};
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<lockbox::schema::hash32_t>);
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

lockbox::schema::hash32_t hash(const std::string_view& str) {
  auto state = hasher{};
  state.update(str.data(), str.size());
  return state.finalize();
}

lockbox::schema::hash32_t hash(const lockbox::schema::bytes_view_t& bytes) {
  auto state = hasher{};
  state.update(bytes.data(), bytes.size());
  return state.finalize();
}

lockbox::schema::hash32_t hash(
    std::initializer_list<lockbox::schema::bytes_view_t> parts) {
  auto state = hasher{};
  for (const auto& part : parts) {
    state.update(part.data(), part.size());
  }
  return state.finalize();
}

}  // namespace lockbox::blake3
