#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error. */

/* Stitch an ordered folder of frames into one panorama.
   Example:
     borestitch-cli stitch --folder=./frames --save=./out --unwrap --detector=sift */
int run_stitch  (int argc, char** argv);

/* Unwrap every circular frame of a folder into a rectangular strip.
   Example:
     borestitch-cli unwrap --folder=./raw --save=./strips */
int run_unwrap  (int argc, char** argv);

/* Write a synthetic axial scan (optionally stitched right away).
   Example:
     borestitch-cli simulate --frames=12 --step=25 --save=./sim --stitch */
int run_simulate(int argc, char** argv);
