#pragma once

#include <registrar/schema/primitives.hpp>

namespace registrar::crypto {

bool available();

bool verify_signature(const registrar::schema::bytes_view_t& message,
                      const registrar::schema::signer_id_t& signer,
                      const registrar::schema::signature_t& signature);

}  // namespace registrar::crypto
