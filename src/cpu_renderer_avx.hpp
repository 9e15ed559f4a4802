#pragma once

// AVX escape-time kernels, implemented in cpu_renderer_avx.cpp (built with
// -mavx, only when SLEEF is available). Four horizontally adjacent samples
// per call, standard precision only.
//
// re0:       real coordinate of the leftmost sample
// scale:     plane units between samples
// im:        imaginary coordinate shared by all four samples
// value4:    escape value per lane (max_iter for lanes that never escaped)
// escaped4:  1 for lanes that escaped, 0 otherwise

void avx_mandelbrot_4(double re0, double scale, double im,
                      int max_iter, double escape_radius, bool smooth,
                      double* value4, int* escaped4);

void avx_julia_4(double re0, double scale, double im,
                 double julia_re, double julia_im,
                 int max_iter, double escape_radius, bool smooth,
                 double* value4, int* escaped4);
