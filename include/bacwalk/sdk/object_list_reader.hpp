//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_OBJECT_LIST_READER_HPP_INCLUDED
#define BACWALK_SDK_OBJECT_LIST_READER_HPP_INCLUDED

#include "execution.hpp"

#include "bacwalk/bacnet/object_id.hpp"
#include "bacwalk/platform/defines.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace bacwalk
{
namespace sdk
{

/// One object of a remote device, together with the outcome of its name resolution.
///
struct ObjectRecord final
{
    /// Name resolution was not requested (see `ObjectListReader::Params::resolve_names`).
    struct NotRequested final
    {};

    struct Resolved final
    {
        std::string name;
    };

    /// Name resolution failed for this particular object; `reason` is f.e. "timeout" or "rejected: ...".
    struct Failed final
    {
        std::string reason;
    };

    using Name = cetl::variant<NotRequested, Resolved, Failed>;

    bacnet::ObjectIdentifier object_id;
    Name                     name;

};  // ObjectRecord

/// Defines client side interface of a unicast BACnet/IP object list reader.
///
/// The reader talks to exactly one remote device. A read discovers the device instance (directed Who-Is)
/// unless it is already known, reads the device's `objectList` property, and then reads `objectName`
/// of each listed object - strictly one request at a time.
///
class ObjectListReader
{
public:
    using Ptr = std::unique_ptr<ObjectListReader>;

    static constexpr std::uint16_t DefaultTargetPort = 47808;  // 0xBAC0
    static constexpr std::uint16_t DefaultLocalPort  = 47809;

    struct Params final
    {
        /// IPv4 address of the device, optionally with ":port" suffix.
        std::string target_address;
        std::uint16_t target_port{DefaultTargetPort};

        /// Known device instance; discovery is skipped when present.
        cetl::optional<std::uint32_t> device_instance;

        /// Local IPv4 address to bind to; "*" binds to all interfaces.
        std::string local_address{"*"};
        std::uint16_t local_port{DefaultLocalPort};

        /// How long to wait for a response to each individual request.
        std::chrono::milliseconds request_timeout{std::chrono::seconds{3}};

        /// Whether to read `objectName` of each listed object.
        bool resolve_names{true};

    };  // Params

    struct Read final
    {
        struct Report final
        {
            std::string               device_address;
            std::uint32_t             device_instance;
            std::vector<ObjectRecord> records;  // in the device's object-list order
        };

        enum class Stage : std::uint8_t
        {
            Transport,
            Discovery,
            ObjectList,
        };

        struct Failure final
        {
            Stage       stage;
            std::string reason;
        };

        using Success = Report;
        using Result  = cetl::variant<Success, Failure>;

    };  // Read

    /// Makes a new reader for the given target device.
    ///
    /// @return `nullptr` if the target or local address is invalid.
    ///
    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource&       memory,
                                   platform::SingleThreadedExecutor& executor,
                                   const Params&                     params);

    ObjectListReader(ObjectListReader&&)                 = delete;
    ObjectListReader(const ObjectListReader&)            = delete;
    ObjectListReader& operator=(ObjectListReader&&)      = delete;
    ObjectListReader& operator=(const ObjectListReader&) = delete;

    virtual ~ObjectListReader() = default;

    /// Reads the object list (and optionally object names) of the target device.
    ///
    /// Each read opens its own local endpoint, which is closed when the read completes or its sender is destroyed.
    /// Per-object name failures do not fail the read - they are reported as `ObjectRecord::Failed`.
    ///
    /// @return An execution sender which emits the async overall result of the operation.
    ///
    virtual SenderOf<Read::Result>::Ptr read() = 0;

protected:
    ObjectListReader() = default;

};  // ObjectListReader

/// Gets printable name of a failed read stage, f.e. "discovery".
///
const char* stageName(const ObjectListReader::Read::Stage stage) noexcept;

}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_OBJECT_LIST_READER_HPP_INCLUDED
