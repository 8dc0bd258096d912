#include "kernel/name_generator.hpp"
#include <cctype>

namespace hive::kernel {

namespace {

const char* const GENERAL_NAMES[] = {
    "Alice", "Bob", "Carol", "David", "Eve", "Frank", "Grace", "Henry",
    "Iris", "Jack", "Kate", "Leo", "Maya", "Noah", "Olivia", "Peter",
    "Quinn", "Rose", "Sam", "Tara", "Uma", "Victor", "Wendy", "Xavier",
    "Yara", "Zoe",
};

const char* const IO_NAMES[] = {
    "Ian", "Ivy", "Isaac", "Isabel", "Igor", "Irene", "Ivan", "Isla",
    "Ira", "Ingrid", "Indigo", "Imogen", "Ike", "Ilana", "Inigo", "Ida",
};

constexpr const char* IO_TYPE = "io_gateway";
constexpr const char* IO_SUFFIX = "-io";

template <size_t N>
int index_of(const char* const (&names)[N], const std::string& base) {
    for (size_t i = 0; i < N; i++) {
        if (base == names[i]) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::string strip_digits(std::string name) {
    while (!name.empty() && std::isdigit(static_cast<unsigned char>(name.back()))) {
        name.pop_back();
    }
    return name;
}

} // namespace

std::string AlphabeticalNameGenerator::next_name(const std::string& type,
                                                 const std::set<std::string>& taken) {
    const bool io = type == IO_TYPE;
    const std::string suffix = io ? IO_SUFFIX : "";

    auto pick = [&](const std::string& counter) -> std::string {
        if (io) {
            for (const char* base : IO_NAMES) {
                std::string candidate = base + counter + suffix;
                if (!taken.count(candidate)) return candidate;
            }
        } else {
            for (const char* base : GENERAL_NAMES) {
                std::string candidate = base + counter;
                if (!taken.count(candidate)) return candidate;
            }
        }
        return {};
    };

    auto name = pick("");
    for (int counter = 2; name.empty(); counter++) {
        name = pick(std::to_string(counter));
    }
    return name;
}

int AlphabeticalNameGenerator::agent_number(const std::string& name) {
    const std::string suffix = IO_SUFFIX;
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        int index = index_of(IO_NAMES, strip_digits(name.substr(0, name.size() - suffix.size())));
        return index < 0 ? -1 : index + 1000;
    }
    int index = index_of(GENERAL_NAMES, strip_digits(name));
    return index < 0 ? -1 : index + 1;
}

} // namespace hive::kernel
