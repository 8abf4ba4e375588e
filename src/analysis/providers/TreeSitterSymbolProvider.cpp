#include "analysis/providers/TreeSitterSymbolProvider.h"
#include "utils/Logger.h"
#include <tree_sitter/tree-sitter-rust.h>
#include <cstring>
#include <memory>
#include <dlfcn.h>

TreeSitterSymbolProvider::TreeSitterSymbolProvider() {
    registerLanguage("rust", {".rs"}, tree_sitter_rust(), rustNodeKinds());
}

TreeSitterSymbolProvider::~TreeSitterSymbolProvider() {
    for (auto* handle : handles) {
        if (handle) {
            dlclose(handle);
        }
    }
}

const TreeSitterSymbolProvider::NodeKindTable& TreeSitterSymbolProvider::rustNodeKinds() {
    static const NodeKindTable table = {
        {"function_item", SymbolKind::Function},
        {"struct_item", SymbolKind::Struct},
        {"enum_item", SymbolKind::Enum},
        {"impl_item", SymbolKind::Impl},
        {"trait_item", SymbolKind::Trait},
        {"mod_item", SymbolKind::Module},
    };
    return table;
}

std::vector<Symbol> TreeSitterSymbolProvider::extractSymbols(const std::string& content, const std::string& relPath) const {
    std::vector<Symbol> results;
    const Language* lang = findLanguage(relPath);
    if (!lang || !lang->language) {
        return results;
    }

    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(), ts_parser_delete);
    if (!parser || !ts_parser_set_language(parser.get(), lang->language)) {
        Logger::getInstance().warn("tree-sitter grammar '" + lang->name + "' could not be loaded (ABI mismatch?)");
        return results;
    }
    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(
        ts_parser_parse_string(parser.get(), nullptr, content.c_str(), static_cast<uint32_t>(content.size())),
        ts_tree_delete);
    if (!tree) {
        return results;
    }

    collectSymbols(ts_tree_root_node(tree.get()), *lang, content, results);
    return results;
}

bool TreeSitterSymbolProvider::supportsExtension(const std::string& ext) const {
    for (const auto& entry : languages) {
        for (const auto& e : entry.extensions) {
            if (e == ext) return true;
        }
    }
    return false;
}

void TreeSitterSymbolProvider::registerLanguage(const std::string& name,
                                                const std::vector<std::string>& extensions,
                                                const TSLanguage* language,
                                                const NodeKindTable& nodeKinds) {
    if (!language || extensions.empty()) return;
    languages.push_back({name, extensions, language, nodeKinds});
}

bool TreeSitterSymbolProvider::registerLanguageFromLibrary(const std::string& name,
                                                           const std::vector<std::string>& extensions,
                                                           const std::string& libraryPath,
                                                           const std::string& symbolName,
                                                           const NodeKindTable& nodeKinds) {
    if (libraryPath.empty() || symbolName.empty()) return false;
    void* handle = dlopen(libraryPath.c_str(), RTLD_NOW);
    if (!handle) {
        const char* err = dlerror();
        Logger::getInstance().warn("dlopen failed for " + libraryPath + ": " + (err ? err : "unknown error"));
        return false;
    }
    auto symbol = reinterpret_cast<const TSLanguage* (*)()>(
        dlsym(handle, symbolName.c_str()));
    if (!symbol) {
        Logger::getInstance().warn("Symbol '" + symbolName + "' not found in " + libraryPath);
        dlclose(handle);
        return false;
    }
    registerLanguage(name, extensions, symbol(), nodeKinds);
    handles.push_back(handle);
    return true;
}

const TSLanguage* TreeSitterSymbolProvider::languageForPath(const std::string& relPath) const {
    const Language* lang = findLanguage(relPath);
    return lang ? lang->language : nullptr;
}

const TreeSitterSymbolProvider::Language* TreeSitterSymbolProvider::findLanguage(const std::string& relPath) const {
    for (const auto& entry : languages) {
        for (const auto& ext : entry.extensions) {
            if (relPath.size() >= ext.size() &&
                relPath.compare(relPath.size() - ext.size(), ext.size(), ext) == 0) {
                return &entry;
            }
        }
    }
    return nullptr;
}

void TreeSitterSymbolProvider::collectSymbols(TSNode node,
                                              const Language& lang,
                                              const std::string& content,
                                              std::vector<Symbol>& out) const {
    auto it = lang.nodeKinds.find(ts_node_type(node));
    if (it != lang.nodeKinds.end()) {
        // Name is the first direct identifier child; nameless nodes are skipped
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            const char* childType = ts_node_type(child);
            if (std::strcmp(childType, "identifier") != 0 &&
                std::strcmp(childType, "type_identifier") != 0) {
                continue;
            }
            uint32_t nameStart = ts_node_start_byte(child);
            uint32_t nameEnd = ts_node_end_byte(child);
            uint32_t startByte = ts_node_start_byte(node);
            uint32_t endByte = ts_node_end_byte(node);
            if (nameEnd > nameStart && nameEnd <= content.size() &&
                startByte < endByte && endByte <= content.size()) {
                out.push_back({content.substr(nameStart, nameEnd - nameStart), it->second,
                               startByte, endByte, "tree_sitter"});
            }
            break;
        }
    }

    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collectSymbols(ts_node_child(node, i), lang, content, out);
    }
}
