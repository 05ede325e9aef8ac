#ifndef SAFEUNORDEREDMAP_H
#define SAFEUNORDEREDMAP_H

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../../utils/safehash.h"
#include "safebase.h"

/**
 * Safe wrapper for an std::unordered_map.
 * Checkpoints only store the original values of the keys modified in each
 * frame (std::nullopt for keys that did not exist), not the whole map.
 * @tparam Key The map key type.
 * @tparam T The map value type.
 */
template <typename Key, typename T> class SafeUnorderedMap : public SafeBase {
  private:
    using Originals = std::unordered_map<Key, std::optional<T>, SafeHash>;

    std::unordered_map<Key, T, SafeHash> map_; ///< Current contents.
    std::vector<std::pair<uint64_t, Originals>> checkpoints_; ///< Original values per frame depth.

    /// Record the original value of a key before it gets modified.
    void markKey(const Key& key) {
      this->markAsUsed();
      if (this->checkpoints_.empty()) return;
      auto& originals = this->checkpoints_.back().second;
      if (originals.contains(key)) return;
      auto it = this->map_.find(key);
      originals.emplace(key, (it == this->map_.end()) ? std::nullopt : std::optional<T>(it->second));
    }

  public:
    using const_iterator = typename std::unordered_map<Key, T, SafeHash>::const_iterator;

    /// Constructor for maps without an owner.
    SafeUnorderedMap() : SafeBase() {}

    /**
     * Constructor.
     * @param owner The contract that owns the map.
     */
    explicit SafeUnorderedMap(BaseContract* owner) : SafeBase(owner) {}

    /// Read-only lookup.
    const_iterator find(const Key& key) const { return this->map_.find(key); }
    const_iterator cbegin() const { return this->map_.cbegin(); }
    const_iterator cend() const { return this->map_.cend(); }
    const_iterator begin() const { return this->map_.cbegin(); }
    const_iterator end() const { return this->map_.cend(); }

    bool contains(const Key& key) const { return this->map_.contains(key); }
    std::size_t size() const { return this->map_.size(); }
    bool empty() const { return this->map_.empty(); }

    /// Mutable access to a value, default-constructing it if missing.
    T& operator[](const Key& key) { this->markKey(key); return this->map_[key]; }

    /**
     * Remove a key.
     * @return The number of removed elements (0 or 1).
     */
    std::size_t erase(const Key& key) {
      if (!this->map_.contains(key)) return 0;
      this->markKey(key);
      return this->map_.erase(key);
    }

    uint64_t checkpointDepth() const override {
      return this->checkpoints_.empty() ? 0 : this->checkpoints_.back().first;
    }

    void checkpoint(uint64_t depth) override { this->checkpoints_.emplace_back(depth, Originals()); }

    bool commit(uint64_t depth) override {
      Originals saved = std::move(this->checkpoints_.back().second);
      this->checkpoints_.pop_back();
      if (depth <= 1) return false;
      if (!this->checkpoints_.empty() && this->checkpoints_.back().first == depth - 1) {
        // The enclosing frame keeps its own originals where it has them.
        auto& parent = this->checkpoints_.back().second;
        for (auto& [key, value] : saved) parent.try_emplace(key, std::move(value));
        return false;
      }
      this->checkpoints_.emplace_back(depth - 1, std::move(saved));
      return true;
    }

    void revert() override {
      for (auto& [key, value] : this->checkpoints_.back().second) {
        if (value.has_value()) {
          this->map_[key] = std::move(*value);
        } else {
          this->map_.erase(key);
        }
      }
      this->checkpoints_.pop_back();
    }
};

#endif // SAFEUNORDEREDMAP_H
