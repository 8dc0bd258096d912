#pragma once
#include <set>
#include <string>

namespace hive::kernel {

class NameGenerator {
public:
    virtual ~NameGenerator() = default;

    // First free name for an agent of `type`, skipping everything in `taken`
    virtual std::string next_name(const std::string& type, const std::set<std::string>& taken) = 0;
};

// Alice, Bob, ... Zoe, then Alice2, Bob2, ...
// io_gateway agents get Ian-io, Ivy-io, ... then Ian2-io, ...
class AlphabeticalNameGenerator : public NameGenerator {
public:
    std::string next_name(const std::string& type, const std::set<std::string>& taken) override;

    // 1-based position in the name list (I/O names from 1000), -1 if not generated
    static int agent_number(const std::string& name);
};

} // namespace hive::kernel
