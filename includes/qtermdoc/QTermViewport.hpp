/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#pragma once

#include <QtCore>

#include <qtermdoc/QTermPageCache.hpp>

/**
 * What the user is looking at: zoom, pan (pixels of the rendered bitmap)
 * and the frame size in terminal cells.
 */
struct QTermViewportState {
    int zoomPercent = 100;
    int panX        = 0;
    int panY        = 0;
    int frameCols   = 1;
    int frameRows   = 1;

    bool isPanned() const {
        return panX != 0 or panY != 0;
    }
};

inline bool operator==( const QTermViewportState& lhs, const QTermViewportState& rhs ) {
    return lhs.zoomPercent == rhs.zoomPercent and lhs.panX == rhs.panX and lhs.panY == rhs.panY and
           lhs.frameCols == rhs.frameCols and lhs.frameRows == rhs.frameRows;
}


inline bool operator!=( const QTermViewportState& lhs, const QTermViewportState& rhs ) {
    return !operator==( lhs, rhs );
}


/**
 * Where and how a bitmap goes on screen.
 * @cropRect:     region of the rendered bitmap that is visible (pixels)
 * @transmitSize: size of the buffer handed to the sink (<= crop, within budget)
 * @targetCells:  cell rectangle, relative to the frame, the buffer is stretched into
 */
struct QTermPlacement {
    QRect cropRect;
    QSize transmitSize;
    QRect targetCells;

    bool isDownscaled() const {
        return transmitSize != cropRect.size();
    }
};

struct QTermViewportLimits {
    /* Largest rendered bitmap, in pixels */
    qint64 maxRenderPixels = 8000000;

    /* Widest rendered bitmap */
    int maxRenderWidth = 8192;

    /* Largest buffer we send to the sink, in pixels */
    qint64 maxTransmitPixels = 2000000;

    int minZoom  = 50;
    int maxZoom  = 400;
    int zoomStep = 25;
};

class QTermViewport {
    public:
        /** Page fits the frame when we are at 100% and not panned */
        static bool fitsFrame( const QTermViewportState& state );

        /** Pixel size of the frame */
        static QSize framePixels( const QTermViewportState& state, QSize cellPx );

        /** Render parameters of @page for the current view */
        static QTermRenderRequest renderRequest( int page, QSizeF pageSizePt, const QTermViewportState& state, QSize cellPx,
                                                 const QTermViewportLimits& limits, QTermRenderOptions::ColorMode mode );

        /**
         * Crop, downscale and center a bitmap of @bitmapSize.
         * The pan in @state is clamped in place so the crop stays inside the bitmap.
         */
        static QTermPlacement place( QSize bitmapSize, QTermViewportState& state, QSize cellPx, qint64 maxTransmitPixels );

        /** Largest size with the aspect of @size whose area is at most @budget */
        static QSize fitToBudget( QSize size, qint64 budget );

        /** A @cells sized rectangle centered inside the frame */
        static QRect centered( QSize cells, int frameCols, int frameRows );

        static int clampZoom( int zoom, const QTermViewportLimits& limits );
};
