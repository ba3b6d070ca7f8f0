/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SEQUENTIAL_DISPATCH_HPP
#define SEQUENTIAL_DISPATCH_HPP

#include "dispatch/DispatchStrategy.hpp"

namespace GridForge {

// Every reaction on the calling thread, in identity order
template <Threading T>
class SequentialDispatch final : public DispatchStrategy<T> {
public:
    void dispatch(Environment<T>& environment, const Snapshot& snapshot,
                  const DispatchSettings& settings, ActionList<T>& out,
                  GenerationReport& report) override;

    const char* name() const override { return "sequential"; }
    bool isParallel() const override { return false; }
};

extern template class SequentialDispatch<Threading::Single>;
extern template class SequentialDispatch<Threading::Shared>;

} // namespace GridForge

#endif // SEQUENTIAL_DISPATCH_HPP
