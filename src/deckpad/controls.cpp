#include "controls.hpp"

namespace deckpad
{
    ControlGroup read_controls(const JoystickState& state, std::span<const ControlBinding> bindings)
    {
        ControlGroup group;
        group.reserve(bindings.size());

        for (auto& binding : bindings) {
            auto value = binding.kind == ControlKind::Button
                ? int(state.get_button(binding.index))
                : int(state.get_axis(binding.index));

            group.push_back(ControlReading {
                .label = binding.label,
                .kind = binding.kind,
                .index = binding.index,
                .value = value,
            });
        }

        return group;
    }
}
