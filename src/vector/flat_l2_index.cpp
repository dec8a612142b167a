#include "docvec/vector/flat_l2_index.h"

#include "docvec/vector/distance.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace docvec::vector {

namespace {

constexpr std::array<char, 4> kMagic{'D', 'V', 'I', 'X'};
constexpr std::uint32_t kFormatVersion = 1;

template <typename T>
void write_pod(std::ostream& out, const T& value) {
  out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
T read_pod(std::istream& in, const char* field) {
  T value{};
  in.read(reinterpret_cast<char*>(&value), sizeof(T));
  if (!in) {
    throw std::runtime_error(std::string("FlatL2Index: truncated input reading ") + field);
  }
  return value;
}

// Bytes left after the current position, or nullopt for non-seekable streams.
std::optional<std::size_t> remaining_bytes(std::istream& in) {
  const auto here = in.tellg();
  if (here == std::streampos(-1)) {
    return std::nullopt;
  }
  in.seekg(0, std::ios::end);
  const auto end = in.tellg();
  in.seekg(here);
  if (end == std::streampos(-1) || !in) {
    in.clear();
    in.seekg(here);
    return std::nullopt;
  }
  return static_cast<std::size_t>(end - here);
}

}  // namespace

FlatL2Index::FlatL2Index(const std::size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw std::invalid_argument("FlatL2Index: dimension must be positive");
  }
}

void FlatL2Index::add(const std::vector<Vector>& vectors) {
  for (const auto& v : vectors) {
    if (v.size() != dimension_) {
      throw std::invalid_argument("FlatL2Index: expected dimension " + std::to_string(dimension_) +
                                  ", got " + std::to_string(v.size()));
    }
  }

  data_.reserve(data_.size() + vectors.size() * dimension_);
  for (const auto& v : vectors) {
    data_.insert(data_.end(), v.begin(), v.end());
  }
  count_ += vectors.size();
}

std::vector<Neighbour> FlatL2Index::search(const Vector& query, const std::size_t k) const {
  if (query.size() != dimension_) {
    throw std::invalid_argument("FlatL2Index: query dimension " + std::to_string(query.size()) +
                                " does not match index dimension " + std::to_string(dimension_));
  }

  std::vector<Neighbour> scored;
  scored.reserve(count_);
  for (std::size_t i = 0; i < count_; ++i) {
    scored.push_back(Neighbour{static_cast<Slot>(i),
                               l2_squared(query.data(), data_.data() + i * dimension_, dimension_)});
  }

  const auto by_distance_then_slot = [](const Neighbour& a, const Neighbour& b) {
    if (a.distance != b.distance) {
      return a.distance < b.distance;
    }
    return a.slot < b.slot;
  };

  const std::size_t top = std::min(k, scored.size());
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(top),
                    scored.end(), by_distance_then_slot);
  scored.resize(top);

  while (scored.size() < k) {
    scored.push_back(Neighbour{kEmptySlot, std::numeric_limits<float>::infinity()});
  }
  return scored;
}

std::size_t FlatL2Index::remove(const std::set<Slot>& slots) {
  if (slots.empty() || count_ == 0) {
    return 0;
  }

  std::size_t write_row = 0;
  std::size_t removed = 0;
  for (std::size_t read_row = 0; read_row < count_; ++read_row) {
    if (slots.count(static_cast<Slot>(read_row)) > 0) {
      ++removed;
      continue;
    }
    if (write_row != read_row) {
      std::memmove(data_.data() + write_row * dimension_, data_.data() + read_row * dimension_,
                   dimension_ * sizeof(float));
    }
    ++write_row;
  }

  count_ = write_row;
  data_.resize(count_ * dimension_);
  return removed;
}

void FlatL2Index::reset() {
  data_.clear();
  count_ = 0;
}

Vector FlatL2Index::reconstruct(const Slot slot) const {
  if (slot < 0 || static_cast<std::size_t>(slot) >= count_) {
    throw std::out_of_range("FlatL2Index: slot " + std::to_string(slot) + " out of range");
  }
  const auto offset = static_cast<std::size_t>(slot) * dimension_;
  return Vector(data_.begin() + static_cast<std::ptrdiff_t>(offset),
                data_.begin() + static_cast<std::ptrdiff_t>(offset + dimension_));
}

void FlatL2Index::write(std::ostream& out) const {
  out.write(kMagic.data(), static_cast<std::streamsize>(kMagic.size()));
  write_pod(out, kFormatVersion);
  write_pod(out, static_cast<std::uint32_t>(dimension_));
  write_pod(out, static_cast<std::uint64_t>(count_));
  if (!data_.empty()) {
    out.write(reinterpret_cast<const char*>(data_.data()),
              static_cast<std::streamsize>(data_.size() * sizeof(float)));
  }
  if (!out) {
    throw std::runtime_error("FlatL2Index: write failed");
  }
}

std::unique_ptr<FlatL2Index> FlatL2Index::read(std::istream& in) {
  std::array<char, 4> magic{};
  in.read(magic.data(), static_cast<std::streamsize>(magic.size()));
  if (!in || magic != kMagic) {
    throw std::runtime_error("FlatL2Index: bad magic");
  }

  const auto version = read_pod<std::uint32_t>(in, "version");
  if (version != kFormatVersion) {
    throw std::runtime_error("FlatL2Index: unsupported format version " + std::to_string(version));
  }

  const auto dimension = read_pod<std::uint32_t>(in, "dimension");
  const auto count = read_pod<std::uint64_t>(in, "count");
  if (dimension == 0) {
    throw std::runtime_error("FlatL2Index: stored dimension is zero");
  }

  // A corrupt header must not drive the allocation below.
  constexpr auto kMaxValues = std::numeric_limits<std::size_t>::max() / sizeof(float);
  if (count > kMaxValues / dimension) {
    throw std::runtime_error("FlatL2Index: header count " + std::to_string(count) +
                             " overflows the buffer size");
  }
  const auto values = static_cast<std::size_t>(count) * dimension;
  const auto remaining = remaining_bytes(in);
  if (remaining.has_value() && values * sizeof(float) > remaining.value()) {
    throw std::runtime_error("FlatL2Index: header announces " + std::to_string(count) +
                             " vectors but only " + std::to_string(remaining.value()) +
                             " bytes follow");
  }

  auto index = std::make_unique<FlatL2Index>(dimension);
  index->data_.resize(values);
  if (!index->data_.empty()) {
    in.read(reinterpret_cast<char*>(index->data_.data()),
            static_cast<std::streamsize>(index->data_.size() * sizeof(float)));
    if (!in) {
      throw std::runtime_error("FlatL2Index: truncated vector data");
    }
  }
  index->count_ = static_cast<std::size_t>(count);
  return index;
}

}  // namespace docvec::vector
