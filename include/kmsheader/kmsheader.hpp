// ============================================================================
// KMS Header - Main Include Header
// ============================================================================
// Include this single header to access all kmsheader functionality.
// ============================================================================

#ifndef KMSHEADER_KMSHEADER_HPP
#define KMSHEADER_KMSHEADER_HPP

// Core types and utilities
#include "kmsheader/types.hpp"
#include "kmsheader/version.hpp"
#include "kmsheader/encoding.hpp"

// Binary format
#include "kmsheader/algorithm.hpp"
#include "kmsheader/key_reference.hpp"
#include "kmsheader/kms_header.hpp"
#include "kmsheader/partial_header.hpp"

// Collaborators
#include "kmsheader/rsa_key.hpp"
#include "kmsheader/rsa_encryptor.hpp"
#include "kmsheader/rsa_decryptor.hpp"
#include "kmsheader/kms_client.hpp"
#include "kmsheader/local_keyring.hpp"

#endif // KMSHEADER_KMSHEADER_HPP
