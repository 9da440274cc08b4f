#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace gw::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

// Raised when an object is used in a state that does not allow the call.
class InvalidOperationError : public Error {
public:
    explicit InvalidOperationError(std::string message)
        : Error(std::move(message)) {}
};

class ContentLoadError : public Error {
public:
    ContentLoadError(std::string_view assetType,
                     std::string_view assetName,
                     std::string details);

    std::string_view assetType() const noexcept { return m_assetType; }
    std::string_view assetName() const noexcept { return m_assetName; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view assetType,
                                    std::string_view assetName,
                                    const std::string& details);

    std::string m_assetType;
    std::string m_assetName;
    std::string m_details;
};

inline std::string ContentLoadError::BuildMessage(std::string_view assetType,
                                                  std::string_view assetName,
                                                  const std::string& details) {
    std::string message;
    message.reserve(assetType.size() + assetName.size() + details.size() + 24);
    message.append("Failed to load [");
    message.append(assetType);
    message.append("] '");
    message.append(assetName);
    message.append("'");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline ContentLoadError::ContentLoadError(std::string_view assetType,
                                          std::string_view assetName,
                                          std::string details)
    : Error(BuildMessage(assetType, assetName, details)),
      m_assetType(assetType),
      m_assetName(assetName),
      m_details(std::move(details)) {}

class GraphicsError : public Error {
public:
    GraphicsError(std::string_view operation, std::string details);

    std::string_view operation() const noexcept { return m_operation; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view operation,
                                    const std::string& details);

    std::string m_operation;
    std::string m_details;
};

inline std::string GraphicsError::BuildMessage(std::string_view operation,
                                               const std::string& details) {
    std::string message;
    message.reserve(operation.size() + details.size() + 24);
    message.append("Graphics error during ");
    message.append(operation);
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline GraphicsError::GraphicsError(std::string_view operation, std::string details)
    : Error(BuildMessage(operation, details)),
      m_operation(operation),
      m_details(std::move(details)) {}

} // namespace gw::core
