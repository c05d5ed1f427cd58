#pragma once

// Sampling density bounds shared by every airfoil family
#define AIRFOILGEN_MIN_POINTS 50   /**< fewest stations per surface */
#define AIRFOILGEN_MAX_POINTS 1000 /**< most stations per surface */

#define PARSEC_COEFFICIENT_COUNT 6 /**< number of x^(i+1/2) basis terms */

#define PARSEC_MIN_CREST_X 0.01            /**< crest must stay off the leading edge */
#define PARSEC_MAX_CREST_X 1.0             /**< general PARSEC crest limit */
#define SIMPLIFIED_PARSEC_MAX_CREST_X 0.99 /**< simplified variant keeps the crest off the TE */

#define SIMPLIFIED_PARSEC_MIN_THICKNESS 0.01
#define SIMPLIFIED_PARSEC_MAX_THICKNESS 0.30

/** te_thickness of 1.0 equates to 1% chord, split evenly between surfaces */
#define PARSEC_TE_THICKNESS_SCALE 0.005

/** relative pivot threshold below which the PARSEC system is treated as singular.
 *  Sits above the roundoff floor of a rank-deficient A (~1e-18) and below
 *  the pivot ratio of a crest at x = 0.9995 (~1.4e-16). */
#define PARSEC_SINGULAR_THRESHOLD 1.0e-17
