//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_FACTORY_HPP_INCLUDED
#define BACWALK_SDK_FACTORY_HPP_INCLUDED

#include <bacwalk/sdk/object_list_reader.hpp>

#include "link/link.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

#include <functional>

namespace bacwalk
{
namespace sdk
{

struct Factory
{
    /// Makes a new link for each read; `nullptr` fails the read at its transport stage.
    using LinkMaker = std::function<link::Link::Ptr()>;

    /// Makes a reader which runs its reads on the given executor, over links made by the `link_maker`.
    ///
    /// @return `nullptr` if the target address is invalid.
    ///
    CETL_NODISCARD static ObjectListReader::Ptr makeObjectListReader(libcyphal::IExecutor&           executor,
                                                                     const ObjectListReader::Params& params,
                                                                     LinkMaker                       link_maker);

};  // Factory

}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_FACTORY_HPP_INCLUDED
