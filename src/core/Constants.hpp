#pragma once

#include <cstddef>

/**
 * @brief Built-in defaults used to assemble PackerConfig
 *
 * Nothing reads these directly except PackerConfig::defaults(); the
 * traversal only ever sees the config it was handed.
 */
namespace ctxpack {

namespace Constants {
    // Eligible extensions (lowercase, leading dot)
    inline constexpr const char* INCLUDED_EXTENSIONS[] = {
        ".py", ".js", ".ts", ".tsx", ".html", ".css", ".json", ".md",
        ".sql", ".go", ".rs", ".java", ".cpp", ".c", ".h", ".hpp", ".ino",
        ".txt", ".yaml", ".yml", ".toml", ".xml", ".sh", ".bat", ".env"
    };

    // Directory/file basenames ignored anywhere in the tree (exact match)
    inline constexpr const char* IGNORED_NAMES[] = {
        ".git", "node_modules", "venv", ".venv", "pycache", "__pycache__",
        "dist", "build", ".idea", ".vscode", ".gemini",
        "package-lock.json", "yarn.lock", "pnpm-lock.yaml", "bun.lockb",
        "images", "assets", "public", "test-results", "playwright-report",
        "coverage", ".next", ".nuxt", "target",
        "logs.txt"
    };

    // Basename globs ignored anywhere in the tree
    inline constexpr const char* IGNORED_WILDCARDS[] = {
        "*.log", "*.audit.json"
    };

    // Artifacts written into the invocation's working directory
    inline constexpr const char* OUTPUT_FILENAME = "codebase_context.md";
    inline constexpr const char* PROMPT_FILENAME = "prompt.txt";

    inline constexpr const char* GITIGNORE_FILENAME = ".gitignore";

    // Environment
    inline constexpr const char* ROOT_ENV_VAR = "CONTEXT_ROOT";

    inline constexpr const char* ASSISTANT_URL = "https://gemini.google.com/app";

    // Divisor for the approximate size in the summary (size is counted in characters)
    constexpr double CHARS_PER_MB = 1024.0 * 1024.0;

    // Exit status for an interrupted run (128 + SIGINT)
    constexpr int EXIT_CANCELLED = 130;

    inline constexpr const char* PREAMBLE =
        "# Codebase Context\n"
        "I am providing my codebase context below in this flattened markdown file. \n"
        "\n"
        "## Project Structure\n"
        "(See file paths below)\n"
        "\n"
        "---\n";

    inline constexpr const char* INSTRUCTION_PROMPT =
        "I have attached a file `codebase_context.md` which contains the full source code "
        "and directory structure of my project. \n"
        "\n"
        "**Instruction:**\n"
        "1.  **Analyze** the provided codebase to understand its architecture, tech stack, "
        "and key components.\n"
        "2.  **Act** as a Senior Software Architect and Coding Assistant for this specific project.\n"
        "3.  **Wait** for my next command. I will ask you to implement features, fix bugs, or "
        "explain code. When I do, provide concrete code examples and file modifications that "
        "fit the existing style and structure.\n"
        "\n"
        "Please confirm you have ingested the context and are ready.";
}
}
