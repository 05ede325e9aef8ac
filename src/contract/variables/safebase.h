#ifndef SAFEBASE_H
#define SAFEBASE_H

#include <cstdint>

// Forward declaration.
class BaseContract;

/**
 * Base class for all "safe" contract variables.
 * A safe variable keeps a stack of checkpoints, one per call frame that
 * modified it, so a failed call can be rolled back without touching the
 * effects of the frames around it.
 *
 * The owning contract's host drives the checkpoints:
 * - the first mutation inside a frame calls markAsUsed(), which asks the host
 *   to register the variable in the current frame (calling checkpoint());
 * - when the frame succeeds the host calls commit(), when it fails revert().
 *
 * Variables that have no owner (or are mutated outside any call frame, e.g.
 * inside a contract constructor) behave like plain variables.
 */
class SafeBase {
  private:
    BaseContract* owner_ = nullptr; ///< Contract that owns the variable.

  protected:
    /// Register the variable as used in the current call frame, if any.
    void markAsUsed();

  public:
    /// Constructor for variables without an owner.
    SafeBase() = default;

    /**
     * Constructor.
     * @param owner The contract that owns the variable.
     */
    explicit SafeBase(BaseContract* owner) : owner_(owner) {}

    SafeBase(const SafeBase&) = delete;
    SafeBase& operator=(const SafeBase&) = delete;

    virtual ~SafeBase() = default;

    /// Depth of the frame owning the latest checkpoint (0 if there is none).
    virtual uint64_t checkpointDepth() const = 0;

    /**
     * Save the current value for the frame at the given depth.
     * @param depth The depth of the frame (1 for a top-level call).
     */
    virtual void checkpoint(uint64_t depth) = 0;

    /**
     * The frame at the given depth succeeded. The checkpoint is dropped, or
     * handed to the enclosing frame if that one has none yet.
     * @param depth The depth of the frame that succeeded.
     * @return `true` if the checkpoint was handed to the enclosing frame
     *         (so the host must register the variable there too).
     */
    virtual bool commit(uint64_t depth) = 0;

    /// The frame owning the latest checkpoint failed. Restore the saved value.
    virtual void revert() = 0;
};

#endif // SAFEBASE_H
