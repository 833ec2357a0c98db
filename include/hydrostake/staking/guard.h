// HYDROSTAKE - Reentrancy Guard
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#ifndef HYDROSTAKE_STAKING_GUARD_H
#define HYDROSTAKE_STAKING_GUARD_H

namespace hydrostake {
namespace staking {

/**
 * Scoped latch over a flag owned by the guarded object.
 *
 * Acquired() is false when the flag was already set, i.e. the guarded
 * operation is being re-entered from a callback. The flag is only cleared
 * by the guard that set it.
 */
class ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& latch) : latch_(latch), acquired_(!latch) {
        if (acquired_) {
            latch_ = true;
        }
    }

    ~ReentrancyGuard() {
        if (acquired_) {
            latch_ = false;
        }
    }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool Acquired() const { return acquired_; }

private:
    bool& latch_;
    bool acquired_;
};

} // namespace staking
} // namespace hydrostake

#endif // HYDROSTAKE_STAKING_GUARD_H
