#pragma once
// Interned identifier. Construct with IdString("text"); equal text yields the
// same id for the lifetime of the process.

#include <cstdint>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rnm {

class IdString {
  public:
    struct NoInternTag {
        explicit NoInternTag() = default;
    };
    static inline constexpr NoInternTag NoIntern{};

    IdString()
        : mId(kInvalid) {}

    explicit IdString(std::string_view sv)
        : mId(internGlobal(sv)) {}

    // Looks the text up without adding it to the pool; invalid if unknown.
    IdString(std::string_view sv, NoInternTag)
        : mId(lookupGlobal(sv)) {}

    static IdString tryLookup(std::string_view sv) {
        return IdString(sv, NoIntern);
    }

    bool valid() const { return mId != kInvalid; }
    uint32_t id() const { return mId; }
    const std::string& str() const { return resolveGlobal(mId); }

    bool operator==(const IdString& o) const { return mId == o.mId; }
    bool operator!=(const IdString& o) const { return mId != o.mId; }
    // Pool order, not text order. Use lexLess for stable output.
    bool operator<(const IdString& o) const { return mId < o.mId; }

    static bool lexLess(const IdString& a, const IdString& b) {
        return a.str() < b.str();
    }

    struct Hash {
        size_t operator()(const IdString& s) const noexcept {
            return std::hash<uint32_t>{}(s.mId);
        }
    };

  private:
    static constexpr uint32_t kInvalid = 0xFFFFFFFFu;
    uint32_t mId;

    static uint32_t internGlobal(std::string_view sv);
    static uint32_t lookupGlobal(std::string_view sv);
    static const std::string& resolveGlobal(uint32_t id);

    struct Pool {
        struct TransparentHash {
            using is_transparent = void;
            size_t operator()(std::string_view sv) const noexcept {
                return std::hash<std::string_view>{}(sv);
            }
            size_t operator()(const std::string& s) const noexcept {
                return (*this)(std::string_view{s});
            }
        };
        struct TransparentEqual {
            using is_transparent = void;
            bool operator()(std::string_view lhs,
                            std::string_view rhs) const noexcept {
                return lhs == rhs;
            }
        };

        // deque keeps str() references valid while the pool grows
        std::deque<std::string> mPool;
        std::unordered_map<std::string, uint32_t, TransparentHash,
                           TransparentEqual>
          mMap;
        std::mutex mMu;
    };

    static Pool& pool();
};

std::ostream& operator<<(std::ostream& os, const IdString& s);

} // namespace rnm
