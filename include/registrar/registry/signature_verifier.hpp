#pragma once

#include <registrar/schema/primitives.hpp>
#include <functional>

namespace registrar::registry {

using signature_verifier_t =
    std::function<bool(const registrar::schema::bytes_view_t& message,
                       const registrar::schema::signer_id_t& signer,
                       const registrar::schema::signature_t& signature)>;

}  // namespace registrar::registry
