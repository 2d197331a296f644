#include "prompt/prompt_library.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include "core/text/text_utils.hpp"

namespace askai::prompt {

using core::errors::AskAiError;
using core::errors::ErrorCategory;

namespace {

constexpr const char* kTextSeparator = "\n\n";

struct Placeholder {
    std::size_t begin = 0;  // position of "${"
    std::size_t end = 0;    // one past "}"
    std::string name;
};

bool is_text_placeholder(const std::string& name) {
    return name == "text" || name == "selected_text";
}

bool is_name_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Finds the next well-formed ${name} at or after `from`.
bool next_placeholder(const std::string& tmpl, std::size_t from, Placeholder& out) {
    std::size_t open = tmpl.find("${", from);
    while (open != std::string::npos) {
        std::size_t pos = open + 2;
        while (pos < tmpl.size() && is_name_char(tmpl[pos])) {
            ++pos;
        }
        if (pos < tmpl.size() && tmpl[pos] == '}' && pos > open + 2) {
            out.begin = open;
            out.end = pos + 1;
            out.name = tmpl.substr(open + 2, pos - open - 2);
            return true;
        }
        open = tmpl.find("${", open + 2);
    }
    return false;
}

OperationSpec make_operation(std::string id, std::string title,
                             std::string description, std::string category,
                             std::string instruction,
                             OperationKind kind = OperationKind::Template) {
    OperationSpec spec;
    spec.id = std::move(id);
    spec.title = std::move(title);
    spec.description = std::move(description);
    spec.category = std::move(category);
    spec.instruction = std::move(instruction);
    spec.kind = kind;
    return spec;
}

}  // namespace

PromptLibrary::PromptLibrary(std::vector<OperationSpec> operations) {
    for (auto& operation : operations) {
        auto it = std::find_if(operations_.begin(), operations_.end(),
                               [&operation](const OperationSpec& existing) {
                                   return existing.id == operation.id;
                               });
        if (it != operations_.end()) {
            *it = std::move(operation);
        } else {
            operations_.push_back(std::move(operation));
        }
    }
}

core::errors::Result<OperationSpec> PromptLibrary::find(
    const std::string& operation_id) const {
    if (operation_id.empty()) {
        return AskAiError{ErrorCategory::Input, "Unknown operation: (empty)",
                          "unknown_operation"};
    }
    for (const auto& operation : operations_) {
        if (operation.id == operation_id) {
            return operation;
        }
    }
    return AskAiError{ErrorCategory::Input, "Unknown operation: " + operation_id,
                      "unknown_operation",
                      "Run 'askai operations' to list the configured operations."};
}

std::vector<std::string> PromptLibrary::required_parameters(
    const OperationSpec& operation) {
    std::vector<std::string> names;
    Placeholder placeholder;
    std::size_t from = 0;
    while (next_placeholder(operation.instruction, from, placeholder)) {
        from = placeholder.end;
        if (is_text_placeholder(placeholder.name)) {
            continue;
        }
        if (std::find(names.begin(), names.end(), placeholder.name) == names.end()) {
            names.push_back(placeholder.name);
        }
    }
    return names;
}

core::errors::Result<std::string> PromptLibrary::render(
    const std::string& operation_id, const std::string& text,
    const protocol::ParamMap& params) const {
    auto found = find(operation_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const OperationSpec& operation = core::errors::get_value(found);

    if (core::text::is_blank(text)) {
        return AskAiError{ErrorCategory::Input, "No text provided",
                          "no_text_provided"};
    }

    if (operation.kind == OperationKind::Custom) {
        const auto custom = params.find("prompt");
        if (custom != params.end() && !core::text::is_blank(custom->second)) {
            return custom->second + kTextSeparator + text;
        }
    }

    for (const auto& name : required_parameters(operation)) {
        if (params.find(name) == params.end()) {
            return AskAiError{ErrorCategory::Input,
                              "Missing parameter '" + name + "' for operation '" +
                                  operation.id + "'",
                              "missing_parameter",
                              "Pass it as --param " + name + "=<value>."};
        }
    }

    std::string prompt;
    prompt.reserve(operation.instruction.size() + text.size() + 2);
    bool text_inserted = false;
    std::size_t copied = 0;
    Placeholder placeholder;
    while (next_placeholder(operation.instruction, copied, placeholder)) {
        prompt.append(operation.instruction, copied, placeholder.begin - copied);
        if (is_text_placeholder(placeholder.name)) {
            prompt += text;
            text_inserted = true;
        } else {
            prompt += params.at(placeholder.name);
        }
        copied = placeholder.end;
    }
    prompt.append(operation.instruction, copied, std::string::npos);

    if (!text_inserted) {
        prompt += kTextSeparator;
        prompt += text;
    }
    return prompt;
}

std::vector<OperationSpec> PromptLibrary::list_operations() const {
    std::vector<OperationSpec> sorted = operations_;
    std::sort(sorted.begin(), sorted.end(),
              [](const OperationSpec& a, const OperationSpec& b) {
                  if (a.title != b.title) {
                      return a.title < b.title;
                  }
                  return a.id < b.id;
              });
    return sorted;
}

std::vector<OperationSpec> PromptLibrary::builtin_operations() {
    return {
        make_operation("improve", "Improve Writing",
                       "Enhance grammar, clarity, and style", "writing",
                       "Please improve the writing of the following text, making it "
                       "clearer, more concise, and better structured:"),
        make_operation("fix_grammar", "Fix Grammar",
                       "Fix grammar and spelling errors", "writing",
                       "Please fix any grammar and spelling errors in the following "
                       "text:"),
        make_operation("translate", "Translate", "Translate to a chosen language",
                       "translation",
                       "Please translate the following text to ${language}:"),
        make_operation("translate_en", "Translate to English",
                       "Translate text to English", "translation",
                       "Please translate the following text to English:"),
        make_operation("translate_zh", "Translate to Chinese",
                       "Translate text to Chinese", "translation",
                       "Please translate the following text to Chinese:"),
        make_operation("summarize", "Summarize", "Create a concise summary",
                       "analysis",
                       "Please provide a concise summary of the following text:"),
        make_operation("explain", "Explain", "Explain the content clearly",
                       "analysis",
                       "Please explain the following text in simple, clear terms:"),
        make_operation("tone", "Change Tone", "Rewrite in a chosen tone", "writing",
                       "Please rewrite the following text in a ${tone} tone:"),
        make_operation("tone_professional", "Change Tone (Professional)",
                       "Change tone to professional", "writing",
                       "Please rewrite the following text in a professional tone:"),
        make_operation("tone_casual", "Change Tone (Casual)",
                       "Change tone to casual/friendly", "writing",
                       "Please rewrite the following text in a casual, friendly "
                       "tone:"),
        make_operation("continue", "Continue Writing",
                       "Extend and continue the text", "writing",
                       "Please continue writing the following text in the same "
                       "style and context:"),
        make_operation("custom", "Custom Prompt", "Use your own instruction",
                       "custom", "Please help with the following text:",
                       OperationKind::Custom),
    };
}

}  // namespace askai::prompt
