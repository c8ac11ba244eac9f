/**
 * @file ParameterCatalog.cpp
 * @brief Parameter registry contents
 */

#include <bioslurry/io/Console.hpp>
#include <bioslurry/model/ParameterCatalog.hpp>

#include <algorithm>

namespace bioslurry {

std::string to_string(ParameterGroup group) {
    switch (group) {
    case ParameterGroup::InitialConditions:
        return "Initial Conditions";
    case ParameterGroup::Biodegradation:
        return "Biodegradation Kinetics";
    case ParameterGroup::Sorption:
        return "Sorption";
    case ParameterGroup::Metabolite:
        return "AMPA Metabolite";
    case ParameterGroup::Simulation:
        return "Simulation";
    }
    return "Unknown";
}

const std::vector<ParameterDescriptor> &ParameterCatalog::All() {
    using G = ParameterGroup;
    static const std::vector<ParameterDescriptor> entries = {
        // Initial conditions
        {"C_G_aq_0", "Initial glyphosate (C_G,aq,0)", "mg/L", G::InitialConditions, 1.0, 1000.0,
         1.0, &ParameterSet::C_G_aq_0},
        {"C_G_s_0", "Initial sorbed glyphosate (C_G,s,0)", "mg/kg", G::InitialConditions, 0.0,
         1000.0, 1.0, &ParameterSet::C_G_s_0},
        {"C_A_aq_0", "Initial AMPA (C_A,aq,0)", "mg/L", G::InitialConditions, 0.0, 100.0, 1.0,
         &ParameterSet::C_A_aq_0},
        {"X_0", "Initial biomass (X0)", "mg/L", G::InitialConditions, 1.0, 100.0, 1.0,
         &ParameterSet::X_0},

        // Biodegradation kinetics
        {"k_max", "Max. degradation rate (k_max)", "1/h", G::Biodegradation, 0.001, 1.0, 0.001,
         &ParameterSet::k_max},
        {"K_s", "Half-saturation constant (Ks)", "mg/L", G::Biodegradation, 1.0, 100.0, 1.0,
         &ParameterSet::K_s},
        {"mu_max", "Max. growth rate (mu_max)", "1/h", G::Biodegradation, 0.001, 0.5, 0.001,
         &ParameterSet::mu_max},
        {"k_d", "Microbial death rate (k_d)", "1/h", G::Biodegradation, 0.0001, 0.1, 0.0001,
         &ParameterSet::k_d},
        {"Y_x", "Biomass yield (Y_x)", "mg/mg", G::Biodegradation, 0.01, 1.0, 0.01,
         &ParameterSet::Y_x},

        // Sorption
        {"K_d", "Distribution coefficient (Kd)", "L/kg", G::Sorption, 1.0, 500.0, 1.0,
         &ParameterSet::K_d},
        {"k_sorp", "Sorption rate (k_sorp)", "1/h", G::Sorption, 0.001, 1.0, 0.001,
         &ParameterSet::k_sorp},
        {"theta", "Solid/liquid ratio (theta)", "kg/L", G::Sorption, 0.01, 0.5, 0.01,
         &ParameterSet::theta},

        // AMPA
        {"Y_A", "AMPA yield (Y_A)", "mol/mol", G::Metabolite, 0.1, 1.0, 0.01,
         &ParameterSet::Y_A},
        {"k_A", "AMPA degradation (k_A)", "1/h", G::Metabolite, 0.001, 0.5, 0.001,
         &ParameterSet::k_A},

        // Simulation
        {"t_final", "Final time", "h", G::Simulation, 24.0, 720.0, 24.0, &ParameterSet::t_final},
        {"dt", "Time step", "h", G::Simulation, 0.01, 2.0, 0.01, &ParameterSet::dt},
    };
    return entries;
}

std::vector<const ParameterDescriptor *> ParameterCatalog::InGroup(ParameterGroup group) {
    std::vector<const ParameterDescriptor *> out;
    for (const auto &entry : All()) {
        if (entry.group == group) {
            out.push_back(&entry);
        }
    }
    return out;
}

const ParameterDescriptor *ParameterCatalog::Find(const std::string &key) {
    const auto &entries = All();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&key](const ParameterDescriptor &d) { return d.key == key; });
    return it == entries.end() ? nullptr : &*it;
}

const ParameterDescriptor &ParameterCatalog::Require(const std::string &key) {
    const auto *entry = Find(key);
    if (entry == nullptr) {
        BIOSLURRY_THROW(ConfigError::UnknownKey("parameters", key));
    }
    return *entry;
}

double ParameterCatalog::Get(const ParameterSet &params, const std::string &key) {
    return params.*(Require(key).field);
}

void ParameterCatalog::Set(ParameterSet &params, const std::string &key, double value) {
    params.*(Require(key).field) = value;
}

std::vector<std::string> ParameterCatalog::OutOfRange(const ParameterSet &params) {
    std::vector<std::string> warnings;
    for (const auto &entry : All()) {
        const double value = params.*(entry.field);
        if (value < entry.min || value > entry.max) {
            warnings.push_back(entry.key + " = " + Console::FormatFixed(value, 4) +
                               " outside recommended range [" +
                               Console::FormatFixed(entry.min, 4) + ", " +
                               Console::FormatFixed(entry.max, 4) + "] " + entry.unit);
        }
    }
    return warnings;
}

} // namespace bioslurry
