#pragma once

namespace XodrCodec
{
    // Allowed gap / overlap between consecutive s-ordered records, in meters
    const double SequenceEpsilon = 1e-6;

    // Default tolerance of reference line continuity (position in m, heading in rad)
    const double ContinuityTolerance = 1e-6;

    /*Spiral integration: each Gauss-Legendre piece turns at most this much (rad)*/
    const double SpiralMaxPieceTurn = 0.05;
    const double SpiralMaxPieceLength = 5.0;

    // Arc length inversion of cubic curves
    const int ArcLengthMaxIterations = 64;
    const double ArcLengthTolerance = 1e-12;

    // Gauss-Legendre pieces used to measure a cubic's arc length
    const int CubicLengthPieces = 64;
}
