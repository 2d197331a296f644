#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/errors/askai_errors.hpp"
#include "protocol/invocation_contract.hpp"

namespace askai::prompt {

enum class OperationKind {
    Template,  // instruction comes from the table
    Custom     // caller may replace the instruction with params["prompt"]
};

// A named text transformation. `instruction` may reference request
// parameters as ${name}; ${text} or ${selected_text} mark where the input
// goes. Without a text placeholder the input is appended after a blank line.
struct OperationSpec {
    std::string id;
    std::string title;
    std::string description;
    std::string category;
    std::string instruction;
    OperationKind kind = OperationKind::Template;
};

class PromptLibrary {
public:
    explicit PromptLibrary(std::vector<OperationSpec> operations);

    core::errors::Result<std::string> render(
        const std::string& operation_id, const std::string& text,
        const protocol::ParamMap& params = {}) const;

    core::errors::Result<OperationSpec> find(const std::string& operation_id) const;

    // Sorted by title, then id.
    std::vector<OperationSpec> list_operations() const;

    std::size_t size() const { return operations_.size(); }

    // Parameter names referenced by the instruction, in order of first use,
    // excluding the text placeholders.
    static std::vector<std::string> required_parameters(const OperationSpec& operation);

    static std::vector<OperationSpec> builtin_operations();

private:
    std::vector<OperationSpec> operations_;
};

}  // namespace askai::prompt
