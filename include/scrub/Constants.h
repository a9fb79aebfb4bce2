/* Copyright (c) 2024-2026 The scrub authors
 *
 * This file is part of scrub.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef SCRUBCONSTANTS_H
#define SCRUBCONSTANTS_H

/*
 * Keep this file 'C' compatible.
 *
 * New values must be added to the end of each enumerated type so that
 * no constant's numerical value changes.
 */

/* Error Codes */

enum scrub_error_code_e {
    scrub_e_success = 0,
    scrub_e_internal,      /* logic/programming error -- indicates bug */
    scrub_e_configuration, /* invalid settings, detected before mutation */
    scrub_e_validation,    /* malformed input such as a bad regex */
    scrub_e_structure,     /* dangling reference, cyclic page tree */
    scrub_e_crypto,        /* key construction or signature failure */
};

/* Object Types */

enum scrub_object_type_e {
    ot_null = 0,
    ot_boolean,
    ot_integer,
    ot_real,
    ot_string,
    ot_name,
    ot_array,
    ot_dictionary,
    ot_stream,
    ot_reference,
};

/* Resource categories, in the order the cleaner processes them */

enum scrub_resource_e {
    scrub_res_font = 0,
    scrub_res_image,
    scrub_res_form,
    scrub_res_pattern,
    scrub_res_colorspace,
    scrub_res_gstate,
    scrub_res_none,
};

/* Pattern match kinds */

enum scrub_match_kind_e {
    scrub_mk_embedded_file = 0,
    scrub_mk_metadata,
    scrub_mk_javascript,
    scrub_mk_form_data,
    scrub_mk_annotation,
    scrub_mk_application_trace,
    scrub_mk_system_trace,
    scrub_mk_user_trace,
    scrub_mk_custom,
};

/* Detector types */

enum scrub_detector_e {
    scrub_det_structure = 0,
    scrub_det_byte_pattern,
    scrub_det_text_pattern,
    scrub_det_custom,
};

/* Symmetric algorithms for metadata encryption */

enum scrub_encryption_e {
    scrub_enc_aes_cbc = 0,
    scrub_enc_rc4_drop128,
};

/* Signature algorithms */

enum scrub_signature_e {
    scrub_sig_rsa_pkcs1_sha256 = 0,
    scrub_sig_ecdsa_p256_sha256,
};

#endif /* SCRUBCONSTANTS_H */
