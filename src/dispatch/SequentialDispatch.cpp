/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "dispatch/SequentialDispatch.hpp"

namespace GridForge {

template <Threading T>
void SequentialDispatch<T>::dispatch(Environment<T>& environment, const Snapshot& snapshot,
                                     const DispatchSettings& settings, ActionList<T>& out,
                                     GenerationReport& report) {
    const size_t count = environment.slotCount();
    out.clear();
    out.reserve(count);

    for (size_t slot = 0; slot < count; ++slot) {
        out.emplace_back(environment.idAt(slot),
                         reactGuarded(environment.entityAt(slot), snapshot, settings.seed,
                                      report.diagnostics));
    }

    report.parallel = false;
    report.batches = count > 0 ? 1 : 0;
}

template class SequentialDispatch<Threading::Single>;
template class SequentialDispatch<Threading::Shared>;

} // namespace GridForge
