#pragma once

#include <pugixml.hpp>
#include <string>

/**
 * @brief Base for builders that emit a libvirt XML definition.
 *
 * Derived builders fill `doc` in buildDocument(); build() serialises it.
 * Every build() starts from an empty document so a builder can be reused.
 */
class IXmlBuilderBase {
protected:
    pugi::xml_document doc;

    virtual void buildDocument() = 0;

public:
    IXmlBuilderBase() = default;

    IXmlBuilderBase(const IXmlBuilderBase&) = delete;
    IXmlBuilderBase& operator=(const IXmlBuilderBase&) = delete;

    IXmlBuilderBase(IXmlBuilderBase&&) noexcept = default;
    IXmlBuilderBase& operator=(IXmlBuilderBase&&) noexcept = default;

    [[nodiscard]] std::string build() {
        doc.reset();
        buildDocument();

        struct xml_string_writer : pugi::xml_writer {
            std::string result;
            void write(const void* data, size_t size) override {
                result.append(static_cast<const char*>(data), size);
            }
        };

        xml_string_writer writer;
        doc.save(writer, "  ", pugi::format_default | pugi::format_no_declaration);
        return writer.result;
    }

    [[nodiscard]] const pugi::xml_document& getDocument() const noexcept {
        return doc;
    }

    virtual ~IXmlBuilderBase() = default;
};
