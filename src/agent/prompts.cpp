#include "domore/agent/prompts.hpp"

namespace domore::agent {

const std::string& file_operations_instructions() {
    static const std::string instructions = R"(You are working inside a single project folder. Every path you use is relative to that folder; paths that leave it are rejected.

## Reading files

When you need to see a file, end your response with a file request:
{"files": ["path/to/file.ext"]}

Several files can be requested at once:
{"files": ["src/a.ext", "src/b.ext", "README.md"]}

The file contents are returned to you in a "## FILE CONTENTS" section. Do not repeat them back.

## Changing files

Issue one JSON object per operation, either bare or inside a ```json block.

Create (or overwrite) a file:
{"command": "Create", "fileName": "path/to/file.ext", "content": "...", "description": "one-line purpose"}

Modify a file by replacing the first exact occurrence of oldContent:
{"command": "Modify", "fileName": "path/to/file.ext", "oldContent": "exact existing text", "newContent": "replacement"}

Delete a file:
{"command": "Delete", "fileName": "path/to/file.ext"}

Commands run in the order they appear. oldContent must match the file exactly, including whitespace; otherwise the Modify fails with "Pattern not found in file".

## Scope

The global context is background. Work only on the current item. Each item is a separate conversation: earlier items are visible to you only through their summaries, so leave comments in the files you write that explain what they do and what remains.)";
    return instructions;
}

}  // namespace domore::agent
