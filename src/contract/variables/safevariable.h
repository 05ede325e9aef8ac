#ifndef SAFEVARIABLE_H
#define SAFEVARIABLE_H

#include <utility>
#include <vector>

#include "safebase.h"

/**
 * Safe wrapper around a single value.
 * Checkpoints store a full copy of the value.
 * @tparam T The wrapped type.
 */
template <typename T> class SafeVariable : public SafeBase {
  protected:
    T value_; ///< Current value.
    std::vector<std::pair<uint64_t, T>> checkpoints_; ///< Saved values, one per frame depth.

  public:
    /**
     * Constructor.
     * @param owner The contract that owns the variable.
     * @param value The initial value.
     */
    explicit SafeVariable(BaseContract* owner, const T& value = T()) : SafeBase(owner), value_(value) {}

    /// Constructor for variables without an owner.
    explicit SafeVariable(const T& value = T()) : SafeBase(), value_(value) {}

    /// Getter for the current value.
    const T& get() const { return this->value_; }

    /// Setter for the current value.
    void set(const T& value) { this->markAsUsed(); this->value_ = value; }

    /// Assignment operator.
    SafeVariable& operator=(const T& value) { this->set(value); return *this; }

    bool operator==(const T& other) const { return this->value_ == other; }
    bool operator!=(const T& other) const { return this->value_ != other; }

    uint64_t checkpointDepth() const override {
      return this->checkpoints_.empty() ? 0 : this->checkpoints_.back().first;
    }

    void checkpoint(uint64_t depth) override { this->checkpoints_.emplace_back(depth, this->value_); }

    bool commit(uint64_t depth) override {
      T saved = std::move(this->checkpoints_.back().second);
      this->checkpoints_.pop_back();
      if (depth <= 1) return false;
      if (!this->checkpoints_.empty() && this->checkpoints_.back().first == depth - 1) return false;
      this->checkpoints_.emplace_back(depth - 1, std::move(saved));
      return true;
    }

    void revert() override {
      this->value_ = std::move(this->checkpoints_.back().second);
      this->checkpoints_.pop_back();
    }
};

#endif // SAFEVARIABLE_H
