/// @file device.cpp
/// @brief Device base class implementation

#include "simulation/device.hpp"

#include "simulation/input_resolver.hpp"

#include <utility>

namespace latchwork {

Device::Device(size_t min_inputs, const std::vector<std::string>& named_inputs)
    : min_inputs_(min_inputs), inputs_(min_inputs) {
    if (min_inputs == 0) {
        throw ArityError("Device requires a minimum of at least 1 input");
    }
    for (const std::string& name : named_inputs) {
        named_inputs_.emplace(name, Source());
    }
}

void Device::set_inputs(std::vector<Source> sources) {
    if (sources.size() < min_inputs_) {
        throw ArityError("Device requires at least " + std::to_string(min_inputs_) +
                         " inputs, got " + std::to_string(sources.size()));
    }
    inputs_ = std::move(sources);
}

void Device::set_input(Source source) {
    set_inputs({std::move(source)});
}

bool Device::is_enabled() const {
    return resolve(enable_) == Signal::HIGH;
}

Signal Device::evaluate() {
    if (!is_enabled()) {
        return Signal::FLOATING;
    }
    return guard_.run([this] { return compute(); });
}

Signal Device::get_input(const std::string& name) const {
    return resolve(named_input(name));
}

const Source& Device::named_input(const std::string& name) const {
    auto it = named_inputs_.find(name);
    if (it == named_inputs_.end()) {
        throw std::out_of_range("Unknown input name: " + name);
    }
    return it->second;
}

void Device::set_input(const std::string& name, Source source) {
    auto it = named_inputs_.find(name);
    if (it == named_inputs_.end()) {
        throw std::out_of_range("Unknown input name: " + name);
    }
    it->second = std::move(source);
}

std::vector<std::string> Device::input_names() const {
    std::vector<std::string> names;
    names.reserve(named_inputs_.size());
    for (const auto& [name, source] : named_inputs_) {
        names.push_back(name);
    }
    return names;
}

Source to_source(Device& device) {
    Device* target = &device;
    return Source(std::function<Signal()>([target] { return target->evaluate(); }));
}

} // namespace latchwork
